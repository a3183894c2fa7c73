#pragma once

#include <relay/config.hpp>
#include <relay/result.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace relay {

/**
 * AdmissionGate - Counting semaphore bounding in-flight requests.
 *
 * QUEUE waits up to queue_timeout_ms for a slot; REJECT fails at once.
 * Both fail with OVERLOADED.
 */
class AdmissionGate {
public:
    /**
     * RAII slot; releases on destruction.
     */
    class Ticket {
    public:
        Ticket() = default;
        ~Ticket() { reset(); }

        Ticket(Ticket&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Ticket& operator=(Ticket&& other) noexcept {
            if (this != &other) {
                reset();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

        void reset();
        bool held() const { return gate_ != nullptr; }

    private:
        friend class AdmissionGate;
        explicit Ticket(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_ = nullptr;
    };

    explicit AdmissionGate(AdmissionConfig config);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    Result<Ticket> acquire();

    size_t in_flight() const;
    size_t capacity() const { return config_.max_concurrent_requests; }

private:
    AdmissionConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    size_t in_flight_ = 0;

    void release();
};

}  // namespace relay
