#include "Snapshot.hpp"
#include <cmath>
#include <memory>
#include <sstream>
#include <spdlog/spdlog.h>
#include "../core/Errors.hpp"
#include "../core/Scheduler.hpp"
#include "../utils/TimeUtil.hpp"

static std::string rowLabel(const char* table, std::size_t index) {
    return std::string(table) + "[" + std::to_string(index) + "]";
}

static const Json::Value& requireMember(const Json::Value& row, const char* key, const std::string& label) {
    if (!row.isObject() || !row.isMember(key)) {
        throw ValidationError(label + ": missing '" + key + "'");
    }
    return row[key];
}

static std::string requireString(const Json::Value& row, const char* key, const std::string& label) {
    const Json::Value& v = requireMember(row, key, label);
    if (!v.isString()) throw ValidationError(label + ": '" + key + "' must be a string");
    return v.asString();
}

static std::string requireId(const Json::Value& row, const char* key, const std::string& label) {
    std::string id = requireString(row, key, label);
    if (id.empty()) throw ValidationError(label + ": '" + key + "' is empty");
    return id;
}

static std::optional<std::string> optionalString(const Json::Value& row, const char* key, const std::string& label) {
    if (!row.isMember(key) || row[key].isNull()) return std::nullopt;
    if (!row[key].isString()) throw ValidationError(label + ": '" + key + "' must be a string or null");
    return row[key].asString();
}

static std::time_t requireTimestamp(const Json::Value& row, const char* key, const std::string& label) {
    std::string text = requireString(row, key, label);
    std::time_t t = 0;
    if (!TimeUtil::parseTimestamp(text, t)) {
        throw ValidationError(label + ": '" + key + "' is not an RFC 3339 timestamp: " + text);
    }
    return t;
}

static double requireNumber(const Json::Value& row, const char* key, const std::string& label) {
    const Json::Value& v = requireMember(row, key, label);
    if (!v.isNumeric()) throw ValidationError(label + ": '" + key + "' must be a number");
    double d = v.asDouble();
    if (!std::isfinite(d)) throw ValidationError(label + ": '" + key + "' is not finite");
    return d;
}

static int requireCount(const Json::Value& row, const char* key, const std::string& label) {
    const Json::Value& v = requireMember(row, key, label);
    if (!v.isIntegral() || !v.isInt()) throw ValidationError(label + ": '" + key + "' must be an integer");
    int n = v.asInt();
    if (n < 0) throw ValidationError(label + ": '" + key + "' must not be negative");
    return n;
}

static Json::Value optionalToJson(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Item SnapshotCodec::parseWord(const Json::Value& row, std::size_t index) {
    const std::string label = rowLabel("words", index);
    if (!row.isObject()) throw ValidationError(label + ": row must be an object");

    Item item;
    item.id = requireId(row, "id", label);
    item.text = requireString(row, "text", label);
    item.translation = optionalString(row, "translation", label);
    item.chapter = optionalString(row, "chapter", label);
    item.group = optionalString(row, "group_name", label);
    if (!item.group) item.group = optionalString(row, "group", label);
    item.sentence = optionalString(row, "sentence", label);
    item.created_at = requireTimestamp(row, "created_at", label);

    auto language = optionalString(row, "language", label);
    if (language && !languageFromString(*language, item.language)) {
        throw ValidationError(label + ": unknown language '" + *language + "'");
    }
    return item;
}

RetentionRecord SnapshotCodec::parseCard(const Json::Value& row, std::size_t index) {
    const std::string label = rowLabel("cards", index);
    if (!row.isObject()) throw ValidationError(label + ": row must be an object");

    RetentionRecord record;
    record.id = requireId(row, "id", label);
    record.item_id = requireId(row, "word_id", label);
    record.due_at = requireTimestamp(row, "due_at", label);
    record.interval_days = requireNumber(row, "interval_days", label);
    record.ease = requireNumber(row, "ease", label);
    record.reps = requireCount(row, "reps", label);
    record.lapses = requireCount(row, "lapses", label);
    if (row.isMember("seen_count") && !row["seen_count"].isNull()) {
        record.seen_count = requireCount(row, "seen_count", label);
    }

    if (record.interval_days < 0.0) throw ValidationError(label + ": 'interval_days' must not be negative");
    if (record.ease <= 0.0) throw ValidationError(label + ": 'ease' must be positive");
    return record;
}

ReviewEvent SnapshotCodec::parseReview(const Json::Value& row, std::size_t index) {
    const std::string label = rowLabel("reviews", index);
    if (!row.isObject()) throw ValidationError(label + ": row must be an object");

    ReviewEvent review;
    review.id = requireId(row, "id", label);
    review.record_id = requireId(row, "card_id", label);

    const Json::Value& grade = requireMember(row, "grade", label);
    ReviewQuality q;
    if (!grade.isIntegral() || !grade.isInt() || !qualityFromInt(grade.asInt(), q)) {
        throw ValidationError(label + ": 'grade' must be an integer in 1..4");
    }
    review.grade = grade.asInt();
    review.reviewed_at = requireTimestamp(row, "reviewed_at", label);
    return review;
}

Snapshot SnapshotCodec::fromJson(const Json::Value& root) {
    if (!root.isObject()) throw ValidationError("snapshot must be a JSON object");

    Snapshot snap;
    const char* tables[] = { "words", "cards", "reviews" };
    for (const char* table : tables) {
        if (root.isMember(table) && !root[table].isArray()) {
            throw ValidationError(std::string("snapshot '") + table + "' must be an array");
        }
    }

    const Json::Value& words = root["words"];
    for (Json::ArrayIndex i = 0; i < words.size(); ++i) snap.words.push_back(parseWord(words[i], i));

    const Json::Value& cards = root["cards"];
    for (Json::ArrayIndex i = 0; i < cards.size(); ++i) snap.cards.push_back(parseCard(cards[i], i));

    const Json::Value& reviews = root["reviews"];
    for (Json::ArrayIndex i = 0; i < reviews.size(); ++i) snap.reviews.push_back(parseReview(reviews[i], i));

    spdlog::debug("Parsed snapshot: {} words, {} cards, {} reviews",
        snap.words.size(), snap.cards.size(), snap.reviews.size());
    return snap;
}

Snapshot SnapshotCodec::parse(const std::string& json_text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    const char* begin = json_text.data();
    if (!reader->parse(begin, begin + json_text.size(), &root, &errs)) {
        spdlog::error("Snapshot JSON parse failed: {}", errs);
        throw ValidationError("snapshot is not valid JSON: " + errs);
    }
    return fromJson(root);
}

Json::Value SnapshotCodec::toJson(const Snapshot& snap) {
    Json::Value root(Json::objectValue);
    root["words"] = Json::Value(Json::arrayValue);
    root["cards"] = Json::Value(Json::arrayValue);
    root["reviews"] = Json::Value(Json::arrayValue);

    for (const auto& item : snap.words) {
        Json::Value row(Json::objectValue);
        row["id"] = item.id;
        row["text"] = item.text;
        row["language"] = languageToString(item.language);
        row["translation"] = optionalToJson(item.translation);
        row["chapter"] = optionalToJson(item.chapter);
        row["group_name"] = optionalToJson(item.group);
        row["sentence"] = optionalToJson(item.sentence);
        row["created_at"] = TimeUtil::formatTimestamp(item.created_at);
        root["words"].append(row);
    }

    for (const auto& record : snap.cards) {
        Json::Value row(Json::objectValue);
        row["id"] = record.id;
        row["word_id"] = record.item_id;
        row["due_at"] = TimeUtil::formatTimestamp(record.due_at);
        row["interval_days"] = record.interval_days;
        row["ease"] = record.ease;
        row["reps"] = record.reps;
        row["lapses"] = record.lapses;
        row["seen_count"] = record.seen_count;
        root["cards"].append(row);
    }

    for (const auto& review : snap.reviews) {
        Json::Value row(Json::objectValue);
        row["id"] = review.id;
        row["card_id"] = review.record_id;
        row["grade"] = review.grade;
        row["reviewed_at"] = TimeUtil::formatTimestamp(review.reviewed_at);
        root["reviews"].append(row);
    }
    return root;
}

std::string SnapshotCodec::serialize(const Snapshot& snap) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson(snap));
}

Snapshot SnapshotCodec::fromStore(const StoreSnapshot& store_snapshot) {
    Snapshot snap;
    snap.words = store_snapshot.items;
    snap.cards = store_snapshot.records;
    snap.reviews = store_snapshot.reviews;
    return snap;
}

StoreSnapshot SnapshotCodec::toStore(const Snapshot& snap) {
    StoreSnapshot store_snapshot;
    store_snapshot.items = snap.words;
    store_snapshot.records = snap.cards;
    store_snapshot.reviews = snap.reviews;
    return store_snapshot;
}
