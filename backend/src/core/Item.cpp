#include "Item.hpp"
#include <cctype>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <sodium.h>

std::string languageToString(Language language) {
    switch (language) {
    case Language::DUTCH: return "dutch";
    case Language::ENGLISH: return "english";
    }
    return "dutch";
}

bool languageFromString(const std::string& text, Language& out) {
    std::string lowered;
    for (char c : text) lowered.push_back(static_cast<char>(std::tolower((unsigned char)c)));

    if (lowered == "dutch" || lowered == "nl") {
        out = Language::DUTCH;
        return true;
    }
    if (lowered == "english" || lowered == "en") {
        out = Language::ENGLISH;
        return true;
    }
    return false;
}

Item::Item(const std::string& t, Language lang)
    : text(t), language(lang)
{
    id = generateID();
    created_at = std::time(nullptr);
    spdlog::debug("Created Item: ID={}, Text={}", id, text);
}

bool Item::sameContent(const Item& other) const {
    return id == other.id &&
        text == other.text &&
        translation == other.translation &&
        language == other.language &&
        chapter == other.chapter &&
        group == other.group &&
        sentence == other.sentence &&
        created_at == other.created_at;
}

bool RetentionRecord::sameSchedule(const RetentionRecord& other) const {
    return id == other.id &&
        item_id == other.item_id &&
        due_at == other.due_at &&
        interval_days == other.interval_days &&
        ease == other.ease &&
        reps == other.reps &&
        lapses == other.lapses &&
        seen_count == other.seen_count;
}

std::string Item::generateID() {
    static std::once_flag sodium_ready;
    std::call_once(sodium_ready, [] {
        if (sodium_init() < 0) {
            throw std::runtime_error("libsodium initialization failed");
        }
    });

    unsigned char bytes[16];
    randombytes_buf(bytes, sizeof(bytes));

    // version 4, RFC 4122 variant
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char out[37];
    std::snprintf(out, sizeof(out),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(out);
}
