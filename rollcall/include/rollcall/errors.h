#pragma once
#include <stdexcept>
#include <string>

namespace rollcall {

enum class ErrorKind {
    MissingDependency,  // model, cascade or optional runtime not available
    NotFound,           // known faces directory or config file absent
    Configuration,      // bad settings or no usable gallery
    Runtime             // capture device or ledger I/O failure
};

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class MissingDependencyError : public Error {
public:
    explicit MissingDependencyError(const std::string& what)
        : Error(ErrorKind::MissingDependency, what) {}
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& what)
        : Error(ErrorKind::NotFound, what) {}
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what)
        : Error(ErrorKind::Configuration, what) {}
};

class RuntimeError : public Error {
public:
    explicit RuntimeError(const std::string& what)
        : Error(ErrorKind::Runtime, what) {}
};

// process exit status for the command line tools
constexpr int kExitUsage = 2;
int exit_code(ErrorKind kind);
const char* to_string(ErrorKind kind);

} // namespace rollcall
