#pragma once
#include <cstddef>
#include <ctime>
#include <deque>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "CardStore.hpp"

enum class SessionState {
    IDLE,
    ACTIVE,
    PROMPT   // run exhausted after at least one review: "continue?"
};

const char* sessionStateName(SessionState state);

// What a front end needs to render one card.
struct CardView {
    std::string record_id;
    std::string item_id;
    std::string text;
    std::optional<std::string> translation;
    std::optional<std::string> chapter;
    std::optional<std::string> group;
    std::time_t due_at = 0;
};

/*
  Bounded review run over the due queue.

    IDLE --start--> ACTIVE --queue empty, reviewed > 0--> PROMPT
    PROMPT --continue--> ACTIVE          ACTIVE/PROMPT --end--> IDLE
    ACTIVE --queue empty, nothing reviewed--> IDLE

  The cap limits how many due records are pulled into one ACTIVE run. It only
  decides when PROMPT is offered and never changes scheduling.
*/
class SessionManager {
public:
    static constexpr std::size_t DEFAULT_SESSION_CAP = 10;

    explicit SessionManager(CardStore& store, std::size_t session_cap = DEFAULT_SESSION_CAP);

    void startSession(std::time_t now);
    void continueSession(std::time_t now);
    void endSession();

    std::optional<CardView> nextDueCard(std::time_t now);
    RetentionRecord gradeCard(const std::string& record_id, ReviewQuality quality, std::time_t now);

    // Rebuild the queue from the store after the records behind it changed
    // (snapshot ingest, bulk delete). An ACTIVE run stays ACTIVE and keeps its
    // reviewed count; other states just drop the queue.
    void redrawQueue(std::time_t now);

    SessionState state() const { return current_state; }
    std::size_t reviewedCount() const { return reviewed; }
    std::size_t sessionCap() const { return cap; }
    std::size_t queuedCount() const { return queue.size(); }

private:
    CardStore& store;
    std::size_t cap;
    SessionState current_state = SessionState::IDLE;
    std::size_t reviewed = 0;
    std::deque<std::string> queue;

    void fillQueue(std::time_t now);
};
