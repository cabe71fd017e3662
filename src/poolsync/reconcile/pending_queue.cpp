#include "poolsync/reconcile/pending_queue.hpp"
#include "poolsync/routing/service_name.hpp"

#include <utility>

namespace poolsync::reconcile {

bool PendingQueue::push(OperationPtr op) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return false;
    ops_.push_back(std::move(op));
    return true;
}

std::vector<OperationPtr> PendingQueue::withdraw(std::string_view service_key) {
    std::vector<OperationPtr> removed;
    std::vector<OperationPtr> kept;

    std::lock_guard<std::mutex> lk(mu_);
    kept.reserve(ops_.size());
    for (auto& op : ops_) {
        if (routing::iequals(op->service_key(), service_key) && op->mark_withdrawn()) {
            removed.push_back(std::move(op));
        } else {
            kept.push_back(std::move(op));
        }
    }
    ops_.swap(kept);
    return removed;
}

std::vector<OperationPtr> PendingQueue::drain() {
    std::vector<OperationPtr> out;
    std::lock_guard<std::mutex> lk(mu_);
    out.swap(ops_);
    return out;
}

std::vector<OperationPtr> PendingQueue::close() {
    std::vector<OperationPtr> out;
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    out.swap(ops_);
    return out;
}

bool PendingQueue::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

std::size_t PendingQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return ops_.size();
}

} // namespace poolsync::reconcile
