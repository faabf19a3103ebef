#include "SessionManager.hpp"
#include <algorithm>

const char* sessionStateName(SessionState state) {
    switch (state) {
    case SessionState::IDLE: return "idle";
    case SessionState::ACTIVE: return "active";
    case SessionState::PROMPT: return "prompt";
    }
    return "unknown";
}

SessionManager::SessionManager(CardStore& s, std::size_t session_cap)
    : store(s), cap(std::max<std::size_t>(1, session_cap))
{
    spdlog::info("SessionManager initialized with session cap {}", cap);
}

void SessionManager::fillQueue(std::time_t now) {
    queue.clear();
    auto due = store.getDue(now);
    for (const auto& card : due) {
        if (queue.size() >= cap) break;
        queue.push_back(card.record.id);
    }
    spdlog::debug("Session queue filled with {} of {} due records", queue.size(), due.size());
}

void SessionManager::startSession(std::time_t now) {
    reviewed = 0;
    current_state = SessionState::ACTIVE;
    fillQueue(now);
    spdlog::info("Session started: {} cards queued", queue.size());
}

void SessionManager::continueSession(std::time_t now) {
    if (current_state != SessionState::PROMPT) {
        spdlog::debug("continueSession() called in state '{}'", sessionStateName(current_state));
    }
    startSession(now);
}

void SessionManager::endSession() {
    spdlog::info("Session ended after {} reviews", reviewed);
    current_state = SessionState::IDLE;
    reviewed = 0;
    queue.clear();
}

void SessionManager::redrawQueue(std::time_t now) {
    queue.clear();
    if (current_state != SessionState::ACTIVE) return;

    // the run keeps its cap: only the slots not yet reviewed are refilled
    std::size_t remaining = reviewed < cap ? cap - reviewed : 0;
    auto due = store.getDue(now);
    for (const auto& card : due) {
        if (queue.size() >= remaining) break;
        queue.push_back(card.record.id);
    }
    spdlog::info("Session queue redrawn: {} cards queued, {} already reviewed", queue.size(), reviewed);
}

std::optional<CardView> SessionManager::nextDueCard(std::time_t now) {
    if (current_state != SessionState::ACTIVE) {
        return std::nullopt;
    }

    while (!queue.empty()) {
        std::string record_id = queue.front();
        queue.pop_front();

        // the record may have been graded, deleted or replaced since queuing
        auto record = store.getRecord(record_id);
        if (!record || record->due_at > now) continue;
        auto item = store.getItem(record->item_id);
        if (!item) continue;

        // keep it at the head until it is graded
        queue.push_front(record_id);

        CardView view;
        view.record_id = record->id;
        view.item_id = item->id;
        view.text = item->text;
        view.translation = item->translation;
        view.chapter = item->chapter;
        view.group = item->group;
        view.due_at = record->due_at;
        return view;
    }

    if (reviewed > 0) {
        current_state = SessionState::PROMPT;
        spdlog::info("Session run complete after {} reviews; prompting to continue", reviewed);
    }
    else {
        current_state = SessionState::IDLE;
        spdlog::info("No due cards; session idle");
    }
    return std::nullopt;
}

RetentionRecord SessionManager::gradeCard(const std::string& record_id, ReviewQuality q, std::time_t now) {
    RetentionRecord updated = store.applyGrade(record_id, q, now);

    ++reviewed;
    queue.erase(std::remove(queue.begin(), queue.end(), record_id), queue.end());
    return updated;
}
