#include <stdexcept>

#include "logger.hpp"
#include "MasterPool.hpp"

MasterPool::MasterPool(const vector<string>& t_masters)
    : masters(t_masters), current(0)
{
    if (masters.empty()) {
        throw invalid_argument("at least one master address is required");
    }
    for (auto& m : masters) {
        if (m.empty()) {
            throw invalid_argument("master address must not be empty");
        }
    }
}

const string& MasterPool::select() const
{
    return masters[current];
}

const string& MasterPool::rotate()
{
    auto log = logger();

    current = (current + 1) % masters.size();
    log->info("Switched to master {} ({} of {})", masters[current], current + 1, masters.size());
    return masters[current];
}
