#pragma once
/**
 * @file pool_client.hpp
 * @brief Pluggable client for the cloud network API backend-pool calls.
 * @details The reconciler only needs these two calls. Production wiring binds
 *          them to the generated cloud SDK; tests use PoolClientSim.
 */

#include <string>

#include "poolsync/cloud/backend_pool.hpp"
#include "poolsync/cloud/cloud_error.hpp"
#include "poolsync/compat/expected.hpp"

namespace poolsync::cloud {

    class PoolClient {
    public:
        virtual ~PoolClient() = default;

        /**
         * @brief Fetch the current definition of a backend pool.
         * @return The pool, or a CloudError (404 when the pool does not exist).
         */
        virtual poolsync_detail::expected<BackendPool, CloudError>
        get_backend_pool(const std::string& load_balancer, const std::string& pool) = 0;

        /**
         * @brief Replace the remote pool definition with `desired`.
         */
        virtual poolsync_detail::expected<void, CloudError>
        create_or_update_backend_pool(const std::string& load_balancer, const std::string& pool,
                                      const BackendPool& desired) = 0;
    };

} // namespace poolsync::cloud
