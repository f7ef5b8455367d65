#pragma once

#include <string>
#include <stdexcept>
#include <exception>

namespace dbbridge {

// Classification shared by every backend
enum class ErrorKind {
    Connection,
    Query,
    Validation,
    Timeout,
    Unsupported,
    Internal
};

// Base class for all errors raised by the core
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Backend could not be reached or authentication failed
class ConnectionError : public DatabaseError {
public:
    explicit ConnectionError(const std::string& message)
        : DatabaseError(ErrorKind::Connection, message) {}
};

// Backend rejected or failed a statement
class QueryError : public DatabaseError {
public:
    explicit QueryError(const std::string& message)
        : DatabaseError(ErrorKind::Query, message) {}
};

// Request was malformed; raised before any network call
class ValidationError : public DatabaseError {
public:
    explicit ValidationError(const std::string& message)
        : DatabaseError(ErrorKind::Validation, message) {}
};

// Explicit deadline exceeded
class TimeoutError : public DatabaseError {
public:
    explicit TimeoutError(const std::string& message)
        : DatabaseError(ErrorKind::Timeout, message) {}
};

// Operation has no meaning for the backend
class UnsupportedOperationError : public DatabaseError {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : DatabaseError(ErrorKind::Unsupported, message) {}
};

class ErrorHandler {
public:
    // True when a driver message indicates the transport itself is broken
    static bool isTransportError(const std::string& message);

    // Classify any exception; non-core exceptions map to Internal
    static ErrorKind kindOf(const std::exception& e);

    static const char* toString(ErrorKind kind);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace dbbridge
