#pragma once
/**
 * @file operation_sink.hpp
 * @brief Destination for operations produced by the endpoint diff engine
 *        (or any other producer).
 */

#include "poolsync/reconcile/operation.hpp"

namespace poolsync::reconcile {

    class OperationSink {
    public:
        virtual ~OperationSink() = default;

        /// Accept an operation. Must not block on I/O.
        virtual void enqueue(OperationPtr op) = 0;
    };

} // namespace poolsync::reconcile
