#ifndef UPLOADERRORS_HPP
#define UPLOADERRORS_HPP

#include <stdexcept>
#include <string>

using namespace std;

class UploadError : public runtime_error {
public:
    explicit UploadError(const string& what) : runtime_error(what) {}
};

// a master could not be reached or refused to hand out an upload address
class MasterUnreachable : public UploadError {
public:
    explicit MasterUnreachable(const string& what) : UploadError(what) {}
};

// the data node did not answer the init request with 201 and an ID
class SessionInitFailed : public UploadError {
public:
    explicit SessionInitFailed(const string& what) : UploadError(what) {}
};

class LocalFileError : public UploadError {
public:
    LocalFileError(const string& path, const string& what)
        : UploadError(path + ": " + what), path(path) {}

    const string path;
};

// the last file ran out of bytes before the server sent 201
class IncompleteUploadError : public UploadError {
public:
    explicit IncompleteUploadError(const string& what) : UploadError(what) {}
};

class TransportError : public UploadError {
public:
    explicit TransportError(const string& what) : UploadError(what) {}
};

// an append answer that is neither an ack, a completion nor a correction
class ProtocolError : public UploadError {
public:
    ProtocolError(long status, const string& what)
        : UploadError(what), status(status) {}

    const long status;
};

#endif // UPLOADERRORS_HPP
