#include "Scheduler.hpp"
#include <algorithm>
#include <cmath>
#include "../utils/TimeUtil.hpp"

bool qualityFromInt(int value, ReviewQuality& out) {
    if (value < static_cast<int>(ReviewQuality::AGAIN) || value > static_cast<int>(ReviewQuality::EASY))
        return false;
    out = static_cast<ReviewQuality>(value);
    return true;
}

const char* qualityName(ReviewQuality quality) {
    switch (quality) {
    case ReviewQuality::AGAIN: return "again";
    case ReviewQuality::HARD: return "hard";
    case ReviewQuality::GOOD: return "good";
    case ReviewQuality::EASY: return "easy";
    }
    return "unknown";
}

Scheduler::Scheduler(const SchedulerConfig& config)
    : cfg(config)
{
    spdlog::info("Scheduler (SM-2) initialized: ease [{:.2f}, {:.2f}], relapse {:.4f}d",
        cfg.ease_min, cfg.ease_max, cfg.relapse_interval_days);
}

RetentionRecord Scheduler::initialRecord(const std::string& item_id, std::time_t now) const {
    RetentionRecord record;
    record.id = Item::generateID();
    record.item_id = item_id;
    record.due_at = now;
    record.interval_days = 0.0;
    record.ease = cfg.initial_ease;
    record.reps = 0;
    record.lapses = 0;
    record.seen_count = 0;
    return record;
}

RetentionRecord Scheduler::transition(const RetentionRecord& record, ReviewQuality q, std::time_t now) const {
    RetentionRecord next = record;
    next.ease = sanitizeEase(record.ease);
    next.interval_days = sanitizeInterval(record.interval_days);
    next.reps = std::max(0, record.reps);
    next.lapses = std::max(0, record.lapses);

    if (q == ReviewQuality::AGAIN) {
        return handleLapse(next, now);
    }

    const double prior_ease = next.ease;
    next.reps += 1;
    next.ease = nextEase(prior_ease, q);
    next.interval_days = nextInterval(next.interval_days, next.reps, prior_ease, q);

    // an early review never pulls a successful card closer than it already was
    next.due_at = std::max(TimeUtil::addDays(now, next.interval_days), record.due_at);
    return next;
}

/* -------------------------
   Lapse handling
   -------------------------
   A failed recall restarts the repetition ladder: the card comes back after
   the short relapse interval and the ease drops by the lapse penalty.
*/
RetentionRecord Scheduler::handleLapse(RetentionRecord record, std::time_t now) const {
    record.lapses += 1;
    record.reps = 0;
    record.ease = std::max(cfg.ease_min, record.ease - cfg.lapse_penalty);
    record.interval_days = cfg.relapse_interval_days;
    record.due_at = TimeUtil::addDays(now, record.interval_days);
    return record;
}

double Scheduler::nextEase(double ease, ReviewQuality q) const {
    double delta = 0.0;
    switch (q) {
    case ReviewQuality::HARD: delta = cfg.hard_ease_delta; break;
    case ReviewQuality::GOOD: delta = cfg.good_ease_delta; break;
    case ReviewQuality::EASY: delta = cfg.easy_ease_delta; break;
    default: break;
    }
    return std::clamp(ease + delta, cfg.ease_min, cfg.ease_max);
}

/* -------------------------
   Interval growth
   -------------------------
   reps is the repetition count *after* this review; ease is the value before
   it (each grade applies its own delta).
     GOOD: 1 day, 6 days, then previous * ease
     HARD: previous * hard_growth, never above GOOD from the same state
     EASY: 4 days, 6 * easy_bonus, then previous * ease * easy_bonus, never
           below GOOD * easy_bonus from the same state
   Seed values never shrink a longer previous interval, so a record seeded
   with reps and interval out of step still orders HARD <= GOOD < EASY.
   Every success path yields at least one day.
*/
double Scheduler::goodInterval(double previous, int reps, double ease) const {
    double interval;
    if (reps <= 1) interval = cfg.first_interval_days;
    else if (reps == 2) interval = cfg.second_interval_days;
    else interval = previous * nextEase(ease, ReviewQuality::GOOD);
    return std::max(interval, previous);
}

double Scheduler::nextInterval(double previous, int reps, double ease, ReviewQuality q) const {
    const double good = goodInterval(previous, reps, ease);
    double interval = good;

    switch (q) {
    case ReviewQuality::HARD:
        interval = std::min(std::max(cfg.first_interval_days, previous * cfg.hard_growth), good);
        break;
    case ReviewQuality::EASY: {
        double base;
        if (reps <= 1) base = cfg.first_easy_interval_days;
        else if (reps == 2) base = cfg.second_interval_days * cfg.easy_bonus;
        else base = previous * nextEase(ease, ReviewQuality::EASY) * cfg.easy_bonus;
        interval = std::max(base, good * cfg.easy_bonus);
        break;
    }
    default:
        break;
    }

    interval = std::max(1.0, interval);
    return std::min(interval, cfg.max_interval_days);
}

double Scheduler::sanitizeEase(double ease) const {
    if (!std::isfinite(ease)) return cfg.initial_ease;
    return std::clamp(ease, cfg.ease_min, cfg.ease_max);
}

double Scheduler::sanitizeInterval(double interval) const {
    if (!std::isfinite(interval) || interval < 0.0) return 0.0;
    return std::min(interval, cfg.max_interval_days);
}
