#pragma once

#include <stdexcept>
#include <string>

namespace megadl {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A command could not be started or its output could not be read.
class SpawnError : public Error {
public:
    using Error::Error;
};

// Recoverable: the item is purged and picked up again by the next run.
class TimeoutError : public Error {
public:
    using Error::Error;
};

class DownloadFailure : public Error {
public:
    using Error::Error;
};

class ChangeIpError : public Error {
public:
    using Error::Error;
};

class PreconditionError : public Error {
public:
    using Error::Error;
};

class ListingError : public Error {
public:
    using Error::Error;
};

} // namespace megadl
