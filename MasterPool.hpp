#ifndef MASTERPOOL_HPP
#define MASTERPOOL_HPP

#include <string>
#include <vector>

using namespace std;

// Candidate master addresses, tried round-robin. Lives for the whole process.
class MasterPool {
public:
    explicit MasterPool(const vector<string>& t_masters);

    // current master
    const string& select() const;

    // advance to the next master, wrapping around, and return it
    const string& rotate();

    size_t size() const { return masters.size(); }
    size_t cursor() const { return current; }

protected:
    vector<string> masters;
    size_t current;
};

#endif // MASTERPOOL_HPP
