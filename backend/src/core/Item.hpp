#pragma once
#include <string>
#include <ctime>
#include <optional>
#include <spdlog/spdlog.h>

enum class Language {
    DUTCH,
    ENGLISH
};

std::string languageToString(Language language);
bool languageFromString(const std::string& text, Language& out);

// A vocabulary unit. Content fields change only through corrections or a
// remote snapshot; scheduling never touches them.
class Item {
public:
    Item() = default;
    Item(const std::string& text, Language language = Language::DUTCH);

    std::string id;
    std::string text;
    std::optional<std::string> translation;
    Language language = Language::DUTCH;
    std::optional<std::string> chapter;
    std::optional<std::string> group;
    std::optional<std::string> sentence;
    std::time_t created_at = 0;

    bool sameContent(const Item& other) const;

    // Random UUID (version 4) from libsodium's CSPRNG
    static std::string generateID();
};

// Fields a caller supplies when authoring a new word.
struct NewItem {
    std::string text;
    std::optional<std::string> translation;
    Language language = Language::DUTCH;
    std::optional<std::string> chapter;
    std::optional<std::string> group;
    std::optional<std::string> sentence;
};

// Scheduling state for exactly one Item.
struct RetentionRecord {
    std::string id;
    std::string item_id;
    std::time_t due_at = 0;
    double interval_days = 0.0;
    double ease = 2.5;
    int reps = 0;
    int lapses = 0;
    int seen_count = 0;

    bool sameSchedule(const RetentionRecord& other) const;
};

// One grading action. Never updated; removed only with its Item.
struct ReviewEvent {
    std::string id;
    std::string record_id;
    int grade = 0;
    std::time_t reviewed_at = 0;
};

inline bool operator==(const ReviewEvent& a, const ReviewEvent& b) {
    return a.id == b.id && a.record_id == b.record_id &&
        a.grade == b.grade && a.reviewed_at == b.reviewed_at;
}
