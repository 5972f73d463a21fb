#pragma once
#include <stdexcept>
#include <string>

namespace press {

// Base of every failure press reports to the user.
class PressError : public std::runtime_error {
public:
    explicit PressError(const std::string& msg) : std::runtime_error(msg) {}
};

class IoError : public PressError {
public:
    explicit IoError(const std::string& msg) : PressError("IO error: " + msg) {}
};

class FileTooLarge : public PressError {
public:
    FileTooLarge(const std::string& path, unsigned long long size, unsigned long long limit)
        : PressError("File too large: " + path + " (" + std::to_string(size) +
                     " bytes, max " + std::to_string(limit) + ")") {}
};

class PatchFormatError : public PressError {
public:
    explicit PatchFormatError(const std::string& msg) : PressError("Malformed response: " + msg) {}
};

class UnresolvedPath : public PressError {
public:
    explicit UnresolvedPath(const std::string& path)
        : PressError("No file on disk matches response path: " + path), path_(path) {}
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class NoChangesToRollback : public PressError {
public:
    NoChangesToRollback() : PressError("No changes to rollback") {}
};

class NoCheckpointToRevert : public PressError {
public:
    NoCheckpointToRevert() : PressError("No checkpoint to revert to") {}
};

class ConfigError : public PressError {
public:
    explicit ConfigError(const std::string& msg) : PressError("Invalid configuration: " + msg) {}
};

// --- Completion service failures ---

class ApiFailure : public PressError {
public:
    explicit ApiFailure(const std::string& msg) : PressError(msg) {}
};

class RequestError : public ApiFailure {
public:
    explicit RequestError(const std::string& msg) : ApiFailure("HTTP request failed: " + msg) {}
};

class JsonError : public ApiFailure {
public:
    explicit JsonError(const std::string& msg) : ApiFailure("JSON parsing failed: " + msg) {}
};

class ApiError : public ApiFailure {
public:
    explicit ApiError(const std::string& msg) : ApiFailure("API returned an error: " + msg) {}
};

} // namespace press
