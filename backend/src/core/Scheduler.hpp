#pragma once
#include <ctime>
#include <string>
#include <spdlog/spdlog.h>
#include "Item.hpp"

enum class ReviewQuality {
    AGAIN = 1,
    HARD = 2,
    GOOD = 3,
    EASY = 4
};

bool qualityFromInt(int value, ReviewQuality& out);
const char* qualityName(ReviewQuality quality);

// Tuneables for the SM-2 family schedule. Intervals are in (fractional) days.
struct SchedulerConfig {
    double initial_ease = 2.5;
    double ease_min = 1.3;
    double ease_max = 2.8;
    double lapse_penalty = 0.20;

    double hard_ease_delta = -0.15;
    double good_ease_delta = 0.0;
    double easy_ease_delta = 0.15;

    double relapse_interval_days = 10.0 / (24.0 * 60.0); // 10 minutes
    double first_interval_days = 1.0;
    double first_easy_interval_days = 4.0;
    double second_interval_days = 6.0;
    double easy_bonus = 1.3;
    double hard_growth = 1.2;
    double max_interval_days = 36500.0;
};

/*
  Pure schedule computation: (record, grade, now) -> record'.

  Lapse (AGAIN):  lapses+1, reps=0, ease-=lapse_penalty, interval=relapse.
  Success:        reps+1, ease+=delta(grade) within [ease_min, ease_max],
                  interval from seed values for the first two reps, then
                  grown from the previous interval; HARD <= GOOD < EASY
                  from any given state.

  transition() is total: any record (even one seeded with out-of-range values
  by a remote snapshot) and any grade produce a valid record with
  due_at >= now, interval >= relapse and ease >= ease_min.
*/
class Scheduler {
public:
    explicit Scheduler(const SchedulerConfig& config = SchedulerConfig());

    RetentionRecord transition(const RetentionRecord& record, ReviewQuality quality, std::time_t now) const;

    // State given to a freshly created Item: due immediately, no history.
    RetentionRecord initialRecord(const std::string& item_id, std::time_t now) const;

    const SchedulerConfig& config() const { return cfg; }

private:
    SchedulerConfig cfg;

    RetentionRecord handleLapse(RetentionRecord record, std::time_t now) const;
    double nextEase(double ease, ReviewQuality quality) const;
    double goodInterval(double previous, int reps, double ease) const;
    double nextInterval(double previous, int reps, double ease, ReviewQuality quality) const;

    double sanitizeEase(double ease) const;
    double sanitizeInterval(double interval) const;
};
