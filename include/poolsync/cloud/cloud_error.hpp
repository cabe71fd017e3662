#pragma once
/**
 * @file cloud_error.hpp
 * @brief Error value returned by the cloud network API collaborator.
 * @details Mirrors the classification the remote client performs: a retriable
 *          flag, the HTTP-style status of the failed call and an optional
 *          retry-after hint. Reconciliation decisions only read these fields.
 */

#include <chrono>
#include <string>

namespace poolsync::cloud {

/** @struct CloudError
 *  @brief Classified failure of a remote backend-pool call.
 */
struct CloudError {
    bool                 retriable{false};   ///< Transient failure, safe to retry once
    int                  http_status{0};     ///< HTTP-style status (0 when not applicable)
    std::chrono::seconds retry_after{0};     ///< Server hint; informational only
    std::string          message;            ///< Raw error text

    /// True when the remote resource does not exist (HTTP 404).
    [[nodiscard]] bool is_not_found() const noexcept;

    /// "Retriable: <bool>, RetryAfter: <n>s, HTTPStatusCode: <code>, RawError: <msg>"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const CloudError&) const = default;

    // Factories for the three classes the reconciler distinguishes.
    static CloudError transient(std::string msg, int http_status = 0);
    static CloudError permanent(std::string msg, int http_status = 0);
    static CloudError not_found(std::string msg);
};

} // namespace poolsync::cloud
