/**
* @file cloud_error.cpp
 * @brief CloudError classification helpers and formatting.
 */
#include "poolsync/cloud/cloud_error.hpp"
#include "poolsync/config/constants.hpp"

#include <utility>

namespace poolsync::cloud {

using namespace poolsync::config::constants;

bool CloudError::is_not_found() const noexcept {
    return http_status == HTTP_STATUS_NOT_FOUND;
}

std::string CloudError::to_string() const {
    std::string out;
    out.reserve(64 + message.size());
    out += "Retriable: ";
    out += retriable ? "true" : "false";
    out += ", RetryAfter: ";
    out += std::to_string(retry_after.count());
    out += "s, HTTPStatusCode: ";
    out += std::to_string(http_status);
    out += ", RawError: ";
    out += message;
    return out;
}

CloudError CloudError::transient(std::string msg, int status) {
    return CloudError{.retriable = true, .http_status = status, .message = std::move(msg)};
}

CloudError CloudError::permanent(std::string msg, int status) {
    return CloudError{.retriable = false, .http_status = status, .message = std::move(msg)};
}

CloudError CloudError::not_found(std::string msg) {
    return CloudError{.retriable = false, .http_status = HTTP_STATUS_NOT_FOUND, .message = std::move(msg)};
}

} // namespace poolsync::cloud
