#include <relay/budget_tracker.hpp>
#include <relay/util/logger.hpp>

#include <algorithm>
#include <sstream>

namespace relay {

BudgetTracker::BudgetTracker(BudgetConfig config, ClockFn clock)
    : config_(config)
    , clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
    window_ = current_window();
}

int64_t BudgetTracker::current_window() const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        clock_().time_since_epoch()).count();
    return secs / 3600;
}

void BudgetTracker::roll_window_unlocked() const {
    int64_t now = current_window();
    if (now != window_) {
        if (spent_ > 0.0) {
            std::ostringstream ss;
            ss << "budget window rolled over, previous spend $" << spent_;
            logger()->info(ss.str());
        }
        window_ = now;
        spent_ = 0.0;
        reserved_ = 0.0;
    }
}

Result<BudgetTracker::Reservation> BudgetTracker::try_reserve(double estimated_cost) {
    double amount = std::max(0.0, estimated_cost);

    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_unlocked();

    if (config_.hourly_budget_usd &&
        spent_ + reserved_ + amount > *config_.hourly_budget_usd) {
        std::ostringstream ss;
        ss << "Hourly budget $" << *config_.hourly_budget_usd
           << " would be exceeded (spent $" << spent_
           << ", reserved $" << reserved_
           << ", requested $" << amount << ")";
        return Error(ErrorCode::COST_BUDGET_EXCEEDED, ss.str());
    }

    reserved_ += amount;

    Reservation res;
    res.amount = amount;
    res.window = window_;
    res.active = true;
    return res;
}

void BudgetTracker::commit(Reservation& reservation, double actual_cost) {
    if (!reservation.active) return;

    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_unlocked();

    if (reservation.window == window_) {
        reserved_ = std::max(0.0, reserved_ - reservation.amount);
    }
    spent_ += std::max(0.0, actual_cost);
    reservation.active = false;
}

void BudgetTracker::release(Reservation& reservation) {
    if (!reservation.active) return;

    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_unlocked();

    if (reservation.window == window_) {
        reserved_ = std::max(0.0, reserved_ - reservation.amount);
    }
    reservation.active = false;
}

double BudgetTracker::spent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_unlocked();
    return spent_;
}

double BudgetTracker::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_unlocked();
    return reserved_;
}

std::optional<double> BudgetTracker::remaining() const {
    if (!config_.hourly_budget_usd) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    roll_window_unlocked();
    return *config_.hourly_budget_usd - spent_ - reserved_;
}

}  // namespace relay
