#include <archive_mcp/core/result.hpp>

#include <sstream>

namespace archive_mcp {

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:          return "config";
        case ErrorCategory::NotFound:        return "not_found";
        case ErrorCategory::InvalidArgument: return "invalid_argument";
        case ErrorCategory::Io:              return "io";
        case ErrorCategory::Unavailable:     return "unavailable";
        case ErrorCategory::Internal:        return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (path.has_value() && !path->empty()) {
        oss << " [" << *path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

} // namespace archive_mcp
