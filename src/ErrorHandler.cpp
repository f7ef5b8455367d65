#include "ErrorHandler.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace dbbridge {

namespace {

// Messages libpq, hiredis and the socket layer produce when the peer is gone
constexpr std::array<const char*, 7> kTransportPatterns = {
    "connection reset by peer",
    "broken pipe",
    "connection closed",
    "server closed the connection",
    "no connection to the server",
    "connection refused",
    "lost synchronization with server",
};

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

thread_local std::string ErrorContext::s_currentContext;

DatabaseError::DatabaseError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind) {
}

bool ErrorHandler::isTransportError(const std::string& message) {
    std::string lower = toLower(message);
    for (const char* pattern : kTransportPatterns) {
        if (lower.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ErrorKind ErrorHandler::kindOf(const std::exception& e) {
    if (auto* dbError = dynamic_cast<const DatabaseError*>(&e)) {
        return dbError->kind();
    }
    return ErrorKind::Internal;
}

const char* ErrorHandler::toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection:
            return "ConnectionError";
        case ErrorKind::Query:
            return "QueryError";
        case ErrorKind::Validation:
            return "ValidationError";
        case ErrorKind::Timeout:
            return "TimeoutError";
        case ErrorKind::Unsupported:
            return "UnsupportedOperationError";
        case ErrorKind::Internal:
        default:
            return "InternalError";
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace dbbridge
