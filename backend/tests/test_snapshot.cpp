#include <gtest/gtest.h>
#include "sync/Snapshot.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

namespace {

const char* VALID = R"({
  "words": [
    {"id": "w1", "text": "huis", "translation": "house", "language": "dutch",
     "chapter": "1", "group_name": "Wonen", "sentence": null,
     "created_at": "2024-05-01T10:00:00Z"},
    {"id": "w2", "text": "boom", "group": "Natuur",
     "created_at": "2024-05-01T12:00:00.250+02:00"}
  ],
  "cards": [
    {"id": "c1", "word_id": "w1", "due_at": "2024-05-02T10:00:00Z",
     "interval_days": 1.0, "ease": 2.5, "reps": 1, "lapses": 0}
  ],
  "reviews": [
    {"id": "r1", "card_id": "c1", "grade": 3, "reviewed_at": "2024-05-01T10:00:00Z"}
  ]
})";

} // namespace

TEST(SnapshotCodecTest, ParsesDataApiPayload) {
    Snapshot snap = SnapshotCodec::parse(VALID);
    ASSERT_EQ(snap.words.size(), 2u);
    ASSERT_EQ(snap.cards.size(), 1u);
    ASSERT_EQ(snap.reviews.size(), 1u);

    EXPECT_EQ(snap.words[0].group, std::optional<std::string>("Wonen"));
    EXPECT_FALSE(snap.words[0].sentence.has_value());
    EXPECT_EQ(snap.words[0].created_at, T0);

    // "group" alias and numeric offset
    EXPECT_EQ(snap.words[1].group, std::optional<std::string>("Natuur"));
    EXPECT_EQ(snap.words[1].created_at, T0);
    EXPECT_EQ(snap.words[1].language, Language::DUTCH);

    EXPECT_EQ(snap.cards[0].item_id, "w1");
    EXPECT_EQ(snap.cards[0].due_at, T0 + DAY);
    EXPECT_EQ(snap.cards[0].reps, 1);
    EXPECT_EQ(snap.reviews[0].record_id, "c1");
    EXPECT_EQ(snap.reviews[0].grade, 3);
}

TEST(SnapshotCodecTest, MissingTablesAreEmpty) {
    Snapshot snap = SnapshotCodec::parse(R"({"words": []})");
    EXPECT_TRUE(snap.words.empty());
    EXPECT_TRUE(snap.cards.empty());
    EXPECT_TRUE(snap.reviews.empty());
}

TEST(SnapshotCodecTest, RejectsMalformedRows) {
    const std::vector<std::string> bad = {
        "not json",
        R"([])",
        R"({"words": {}})",
        R"({"words": [{"text": "huis", "created_at": "2024-05-01T10:00:00Z"}]})",
        R"({"words": [{"id": "", "text": "huis", "created_at": "2024-05-01T10:00:00Z"}]})",
        R"({"words": [{"id": "w1", "text": 7, "created_at": "2024-05-01T10:00:00Z"}]})",
        R"({"words": [{"id": "w1", "text": "huis", "created_at": "yesterday"}]})",
        R"({"words": [{"id": "w1", "text": "huis", "language": "klingon", "created_at": "2024-05-01T10:00:00Z"}]})",
        R"({"cards": [{"id": "c1", "word_id": "w1", "due_at": "2024-05-02T10:00:00Z", "interval_days": 1, "ease": 2.5, "reps": -1, "lapses": 0}]})",
        R"({"cards": [{"id": "c1", "word_id": "w1", "due_at": "2024-05-02T10:00:00Z", "interval_days": "1", "ease": 2.5, "reps": 1, "lapses": 0}]})",
        R"({"reviews": [{"id": "r1", "card_id": "c1", "grade": 5, "reviewed_at": "2024-05-01T10:00:00Z"}]})",
        R"({"reviews": [{"id": "r1", "card_id": "c1", "grade": 0, "reviewed_at": "2024-05-01T10:00:00Z"}]})",
        R"({"reviews": [{"id": "r1", "card_id": "c1", "grade": 2.5, "reviewed_at": "2024-05-01T10:00:00Z"}]})",
    };
    for (const auto& text : bad) {
        EXPECT_THROW(SnapshotCodec::parse(text), ValidationError) << text;
    }
}

TEST(SnapshotCodecTest, SerializedStoreParsesBack) {
    Snapshot snap = SnapshotCodec::parse(VALID);
    Snapshot again = SnapshotCodec::parse(SnapshotCodec::serialize(snap));

    ASSERT_EQ(again.words.size(), snap.words.size());
    EXPECT_TRUE(again.words[0].sameContent(snap.words[0]));
    EXPECT_TRUE(again.cards[0].sameSchedule(snap.cards[0]));
    EXPECT_EQ(again.reviews[0], snap.reviews[0]);
}
