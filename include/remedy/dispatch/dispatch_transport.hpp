#pragma once
/**
 * @file dispatch_transport.hpp
 * @brief Contract for triggering the external remediation job.
 */

#include <chrono>
#include <string>

#include "remedy/error.hpp"

namespace remedy::dispatch {

/** @struct DispatchRequest
 *  @brief Inputs handed to the remediation workflow.
 */
struct DispatchRequest {
    std::string repository;     ///< "owner/repo"
    std::string branch;         ///< Ref to run the workflow on
    std::string workflow;       ///< Workflow file name
    std::string incident_id;
    std::string service_name;
    std::string error_message;
    std::string stack_trace;    ///< Empty when unknown
    std::string timestamp;      ///< Incident creation time, RFC 3339
};

/** @class DispatchTransport
 *  @brief Remote call that starts one job. May be slow or fail transiently.
 *
 * Implementations must return within `timeout`; exceeding it is reported as
 * ErrorCode::Timeout. Any other failure is ErrorCode::DispatchFailure.
 */
class DispatchTransport {
public:
    virtual ~DispatchTransport() = default;

    /// @return External run identifier on success.
    virtual Result<std::string> dispatch(const DispatchRequest& request,
                                         std::chrono::milliseconds timeout) = 0;
};

} // namespace remedy::dispatch
