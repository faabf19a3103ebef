#pragma once
#include <string>
#include <vector>
#include <json/json.h>
#include "../core/Item.hpp"
#include "../core/CardStore.hpp"

// Remote data API payload: {"words": [...], "cards": [...], "reviews": [...]}.
struct Snapshot {
    std::vector<Item> words;
    std::vector<RetentionRecord> cards;
    std::vector<ReviewEvent> reviews;
};

/*
  JSON codec for snapshots. Row-level checks (required keys, types, grade
  range, timestamps) happen here and throw ValidationError; foreign keys are
  checked by the Reconciler, which also knows the local store.

  Card rows:   {id, word_id, due_at, interval_days, ease, reps, lapses[, seen_count]}
  Review rows: {id, card_id, grade, reviewed_at}
  Word rows:   {id, text, created_at[, language, translation, chapter,
                group_name | group, sentence]}
*/
class SnapshotCodec {
public:
    static Snapshot parse(const std::string& json_text);
    static Snapshot fromJson(const Json::Value& root);

    static Json::Value toJson(const Snapshot& snapshot);
    static std::string serialize(const Snapshot& snapshot);

    static Snapshot fromStore(const StoreSnapshot& store_snapshot);
    static StoreSnapshot toStore(const Snapshot& snapshot);

    static Item parseWord(const Json::Value& row, std::size_t index);
    static RetentionRecord parseCard(const Json::Value& row, std::size_t index);
    static ReviewEvent parseReview(const Json::Value& row, std::size_t index);
};
