#include "remedy/error.hpp"

namespace remedy {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation:        return "validation";
        case ErrorCode::UnroutableService: return "unroutable_service";
        case ErrorCode::InvalidTransition: return "invalid_transition";
        case ErrorCode::DispatchFailure:   return "dispatch_failure";
        case ErrorCode::Store:             return "store";
        case ErrorCode::NotFound:          return "not_found";
        case ErrorCode::Timeout:           return "timeout";
        case ErrorCode::Config:            return "config";
    }
    return "unknown";
}

} // namespace remedy
