#pragma once
#include <stdexcept>
#include <string>

namespace ListFile {

enum class ErrorKind {
    InvalidArgument,
    NotFound,
    AccessDenied,
    Cancelled,
    Unexpected,
};

const char* to_string(ErrorKind kind);

// base of all errors surfaced by the lister, never carries a partial result
class Error : public std::runtime_error {
    public:
    Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

    private:
    ErrorKind m_kind;
};

class InvalidArgument : public Error {
    public:
    explicit InvalidArgument(const std::string& msg) : Error(ErrorKind::InvalidArgument, msg) {}
};

class NotFound : public Error {
    public:
    explicit NotFound(const std::string& msg) : Error(ErrorKind::NotFound, msg) {}
};

class AccessDenied : public Error {
    public:
    explicit AccessDenied(const std::string& msg) : Error(ErrorKind::AccessDenied, msg) {}
};

class Cancelled : public Error {
    public:
    explicit Cancelled(const std::string& msg = "operation cancelled") : Error(ErrorKind::Cancelled, msg) {}
};

class Unexpected : public Error {
    public:
    explicit Unexpected(const std::string& msg) : Error(ErrorKind::Unexpected, msg) {}
};

// maps an errno value from open()/read() to the matching error type and throws it
[[noreturn]] void throw_errno(int err, const std::string& msg);

} // namespace ListFile
