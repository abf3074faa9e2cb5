#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy shared by every remedy component.
 * @details Fallible operations return Result<T>; nothing on the incident path
 *          throws. Third-party exceptions are converted at the boundary.
 */

#include <cstdint>
#include <string>
#include <utility>

#include "remedy/compat/expected.hpp"

namespace remedy {

/**
 * @enum ErrorCode
 * @brief Classes of failure surfaced by the orchestration engine.
 */
enum class ErrorCode : std::uint8_t {
    Validation = 1,     ///< Malformed inbound record, rejected before persistence
    UnroutableService,  ///< No service→repository mapping
    InvalidTransition,  ///< Illegal or raced lifecycle change
    DispatchFailure,    ///< Transport failed after exhausting retries
    Store,              ///< Persistence failure
    NotFound,           ///< Unknown incident / run identifier
    Timeout,            ///< Transport call exceeded its deadline
    Config              ///< Configuration rejected by the loader
};

/** @struct Error
 *  @brief Error code plus a human readable message (logged verbatim).
 */
struct Error {
    ErrorCode   code{ErrorCode::Validation};
    std::string message;
};

/// Stable lowercase name for logs and audit payloads.
const char* to_string(ErrorCode code) noexcept;

template <class T>
using Result = remedy_detail::expected<T, Error>;

/// Build the error side of a Result.
inline remedy_detail::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return remedy_detail::unexpected<Error>(Error{code, std::move(message)});
}

/// Forward an existing error unchanged.
inline remedy_detail::unexpected<Error> forward_error(Error err) {
    return remedy_detail::unexpected<Error>(std::move(err));
}

} // namespace remedy
