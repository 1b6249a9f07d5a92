#pragma once

#include <stdexcept>
#include <string>

namespace iopatch {

// Base of every error raised by the patcher
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Bad magic, unsupported header or record size, unusable block size
class FormatError : public Error {
public:
    explicit FormatError(const std::string& message) : Error(message) {}
};

// A header count points past the end of the file
class TruncatedFileError : public FormatError {
public:
    explicit TruncatedFileError(const std::string& message) : FormatError(message) {}
};

// The file parses but its tables contradict each other
class ConsistencyError : public Error {
public:
    explicit ConsistencyError(const std::string& message) : Error(message) {}
};

// A file could not be opened, read or written
class IoError : public Error {
public:
    explicit IoError(const std::string& message) : Error(message) {}
};

// Value does not fit a packed field
class RangeError : public Error {
public:
    explicit RangeError(const std::string& message) : Error(message) {}
};

// The id generator ran out of attempts. Fatal for the whole batch.
class AllocationExhausted : public Error {
public:
    explicit AllocationExhausted(const std::string& message) : Error(message) {}
};

} // namespace iopatch
