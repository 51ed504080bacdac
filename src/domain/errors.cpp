#include "domain/errors.h"

namespace ip6gen::domain {

std::string error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NETWORK: return "NETWORK";
        case ErrorCategory::ASSEMBLY: return "ASSEMBLY";
        case ErrorCategory::SECURITY: return "SECURITY";
        case ErrorCategory::CONFIGURATION: return "CONFIGURATION";
        case ErrorCategory::SYSTEM: return "SYSTEM";
        case ErrorCategory::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

}
