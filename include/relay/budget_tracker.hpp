#pragma once

#include <relay/config.hpp>
#include <relay/result.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace relay {

/**
 * BudgetTracker - Hourly spend ceiling with check-then-reserve admission.
 *
 * A request reserves its estimated cost before dispatch. The reservation is
 * rejected when spent + outstanding reservations + estimate would exceed the
 * ceiling. After the call the reservation is committed with the actual cost
 * (which may overshoot the estimate; the next reservation then fails) or
 * released when nothing was spent.
 *
 * The window is the fixed wall-clock hour [hh:00, hh+1:00) UTC. Reservations
 * taken in an earlier window are committed into the current one.
 */
class BudgetTracker {
public:
    using Clock = std::chrono::system_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Reservation {
        double amount = 0.0;
        int64_t window = 0;   // Hour index the amount was reserved in
        bool active = false;  // Cleared by commit() or release()
    };

    explicit BudgetTracker(BudgetConfig config, ClockFn clock = {});

    BudgetTracker(const BudgetTracker&) = delete;
    BudgetTracker& operator=(const BudgetTracker&) = delete;

    /**
     * Reserve an estimated cost against the current window.
     *
     * @param estimated_cost Expected spend in USD (negative values count as 0)
     * @return Reservation, or COST_BUDGET_EXCEEDED
     */
    Result<Reservation> try_reserve(double estimated_cost);

    /**
     * Convert a reservation into actual spend. No-op for inactive reservations.
     */
    void commit(Reservation& reservation, double actual_cost);

    /**
     * Return a reservation without spending. No-op for inactive reservations.
     */
    void release(Reservation& reservation);

    // Current window
    double spent() const;
    double reserved() const;

    /**
     * @return Ceiling minus spent and reserved (may be negative), or nullopt
     *         when unlimited
     */
    std::optional<double> remaining() const;

    bool limited() const { return config_.hourly_budget_usd.has_value(); }
    const BudgetConfig& config() const { return config_; }

private:
    BudgetConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    mutable int64_t window_ = 0;
    mutable double spent_ = 0.0;
    mutable double reserved_ = 0.0;

    int64_t current_window() const;

    // Must hold mutex_
    void roll_window_unlocked() const;
};

}  // namespace relay
