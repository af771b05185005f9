#include <kingraph/core/result.hpp>

namespace kingraph {

Error Error::NotFound(const std::string& operation, const std::string& subject) {
    return Error{operation, subject, "No person with identity key '" + subject + "'",
                 ErrorCategory::NotFound};
}

Error Error::InvalidConfig(const std::string& subject, const std::string& message) {
    return Error{"ConfigLoader", subject, message, ErrorCategory::InvalidConfig};
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::NotFound:      return "not_found";
        case ErrorCategory::InvalidConfig: return "invalid_config";
        case ErrorCategory::Internal:      return "internal";
    }
    return "internal";
}

} // namespace kingraph
