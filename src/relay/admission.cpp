#include <relay/admission.hpp>
#include <relay/util/logger.hpp>

#include <chrono>

namespace relay {

void AdmissionGate::Ticket::reset() {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

AdmissionGate::AdmissionGate(AdmissionConfig config)
    : config_(config) {}

Result<AdmissionGate::Ticket> AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (in_flight_ >= config_.max_concurrent_requests) {
        if (config_.policy == BackpressurePolicy::REJECT) {
            return Error(ErrorCode::OVERLOADED,
                "Concurrency limit of " + std::to_string(config_.max_concurrent_requests) + " reached");
        }

        bool admitted = slot_freed_.wait_for(lock,
            std::chrono::milliseconds(config_.queue_timeout_ms),
            [this] { return in_flight_ < config_.max_concurrent_requests; });

        if (!admitted) {
            logger()->warning("admission queue timed out after " +
                std::to_string(config_.queue_timeout_ms) + "ms");
            return Error(ErrorCode::OVERLOADED, "Timed out waiting for a request slot");
        }
    }

    ++in_flight_;
    return Ticket(this);
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    slot_freed_.notify_one();
}

size_t AdmissionGate::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

}  // namespace relay
