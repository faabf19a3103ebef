#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "core/CardStore.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

TEST(CardStoreTest, CreateAddsItemAndRecordTogether) {
    Scheduler scheduler;
    CardStore store(scheduler);

    CreatedCard created = store.create(dutchWord("huis", "house"), T0);
    EXPECT_EQ(created.record.item_id, created.item.id);
    EXPECT_EQ(created.item.created_at, T0);

    auto record = store.recordForItem(created.item.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, created.record.id);

    StoreCounts counts = store.counts(T0);
    EXPECT_EQ(counts.total, 1u);
    EXPECT_EQ(counts.due, 1u);
}

TEST(CardStoreTest, GetDueSkipsFutureRecordsAndSortsByDueDate) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto a = store.create(dutchWord("huis", "house"), T0);
    auto b = store.create(dutchWord("boom", "tree"), T0 - 100);
    auto c = store.create(dutchWord("kat", "cat"), T0);

    store.applyGrade(a.record.id, ReviewQuality::GOOD, T0);

    auto due = store.getDue(T0);
    ASSERT_EQ(due.size(), 2u);
    EXPECT_EQ(due[0].record.id, b.record.id);
    EXPECT_EQ(due[1].record.id, c.record.id);
    for (const auto& card : due) EXPECT_LE(card.record.due_at, T0);

    EXPECT_EQ(store.getDue(T0 + DAY - 1).size(), 2u);
    EXPECT_EQ(store.getDue(T0 + DAY).size(), 3u);
    EXPECT_EQ(store.counts(T0).due, 2u);
}

TEST(CardStoreTest, GetDueBreaksTiesById) {
    Scheduler scheduler;
    CardStore store(scheduler);
    for (int i = 0; i < 5; ++i) store.create(dutchWord("woord" + std::to_string(i), "word"), T0);

    auto due = store.getDue(T0);
    ASSERT_EQ(due.size(), 5u);
    for (size_t i = 1; i < due.size(); ++i) EXPECT_LT(due[i - 1].record.id, due[i].record.id);
}

TEST(CardStoreTest, ApplyGradeAppendsOneReview) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);

    RetentionRecord after = store.applyGrade(card.record.id, ReviewQuality::GOOD, T0 + 5);
    EXPECT_EQ(after.reps, 1);
    EXPECT_EQ(after.seen_count, 1);

    auto reviews = store.reviewsFor(card.record.id);
    ASSERT_EQ(reviews.size(), 1u);
    EXPECT_EQ(reviews[0].grade, 3);
    EXPECT_EQ(reviews[0].reviewed_at, T0 + 5);
    EXPECT_TRUE(store.hasReview(reviews[0].id));

    auto stored = store.getRecord(card.record.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->sameSchedule(after));
}

TEST(CardStoreTest, ApplyGradeUnknownRecordThrowsNotFound) {
    Scheduler scheduler;
    CardStore store(scheduler);
    EXPECT_THROW(store.applyGrade("missing", ReviewQuality::GOOD, T0), NotFoundError);
}

TEST(CardStoreTest, FailureBeforeCommitLeavesStoreUntouched) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);
    store.applyGrade(card.record.id, ReviewQuality::GOOD, T0);
    StoreSnapshot before = store.snapshot();

    store.setBeforeCommitHook([](const RetentionRecord&, const RetentionRecord&) {
        throw std::runtime_error("injected failure");
    });
    EXPECT_THROW(store.applyGrade(card.record.id, ReviewQuality::EASY, T0 + DAY), std::runtime_error);

    StoreSnapshot after = store.snapshot();
    EXPECT_TRUE(before.equals(after));
    EXPECT_EQ(store.reviewsFor(card.record.id).size(), 1u);

    // the in-flight mark was released
    store.setBeforeCommitHook(nullptr);
    EXPECT_NO_THROW(store.applyGrade(card.record.id, ReviewQuality::EASY, T0 + DAY));
    EXPECT_EQ(store.reviewsFor(card.record.id).size(), 2u);
}

TEST(CardStoreTest, SecondGradeWhileInFlightConflicts) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);

    bool conflicted = false;
    store.setBeforeCommitHook([&](const RetentionRecord& before, const RetentionRecord&) {
        try {
            store.applyGrade(before.id, ReviewQuality::AGAIN, T0);
        }
        catch (const ConflictError&) {
            conflicted = true;
        }
    });

    RetentionRecord after = store.applyGrade(card.record.id, ReviewQuality::GOOD, T0);
    EXPECT_TRUE(conflicted);
    EXPECT_EQ(after.reps, 1);
    EXPECT_EQ(store.reviewsFor(card.record.id).size(), 1u);
}

TEST(CardStoreTest, FailedWriteThroughRollsBack) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);
    StoreSnapshot before = store.snapshot();

    int writes = 0;
    store.attachPersistence([&](const StoreSnapshot&) {
        ++writes;
        return false;
    });

    EXPECT_THROW(store.applyGrade(card.record.id, ReviewQuality::GOOD, T0), TransientError);
    EXPECT_THROW(store.create(dutchWord("boom", "tree"), T0), TransientError);
    EXPECT_THROW(store.deleteItem(card.item.id), TransientError);
    EXPECT_EQ(writes, 3);
    EXPECT_TRUE(before.equals(store.snapshot()));
}

TEST(CardStoreTest, WriteThroughSeesCommittedState) {
    Scheduler scheduler;
    CardStore store(scheduler);
    StoreSnapshot last;
    store.attachPersistence([&](const StoreSnapshot& snap) {
        last = snap;
        return true;
    });

    auto card = store.create(dutchWord("huis", "house"), T0);
    store.applyGrade(card.record.id, ReviewQuality::GOOD, T0);
    ASSERT_EQ(last.items.size(), 1u);
    ASSERT_EQ(last.reviews.size(), 1u);
    EXPECT_EQ(last.records[0].reps, 1);
}

TEST(CardStoreTest, CorrectionLeavesScheduleAlone) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);
    store.applyGrade(card.record.id, ReviewQuality::GOOD, T0);
    auto schedule = store.getRecord(card.record.id);

    Correction correction;
    correction.translation = FieldUpdate<std::string>::set("");
    Item corrected = store.correctContent(card.item.id, correction);
    EXPECT_EQ(corrected.text, "huis");
    ASSERT_TRUE(corrected.translation.has_value());
    EXPECT_EQ(*corrected.translation, "");

    EXPECT_TRUE(store.getRecord(card.record.id)->sameSchedule(*schedule));
}

TEST(CardStoreTest, EmptyCorrectionIsNoOp) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);
    StoreSnapshot before = store.snapshot();

    Item item = store.correctContent(card.item.id, Correction());
    EXPECT_TRUE(item.sameContent(card.item));
    EXPECT_TRUE(before.equals(store.snapshot()));
    EXPECT_THROW(store.correctContent("missing", Correction()), NotFoundError);
}

TEST(CardStoreTest, DeleteCascadesOverRecordAndReviews) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto keep = store.create(dutchWord("boom", "tree"), T0);
    auto gone = store.create(dutchWord("huis", "house"), T0);
    store.applyGrade(gone.record.id, ReviewQuality::GOOD, T0);
    std::string review_id = store.reviewsFor(gone.record.id).at(0).id;

    store.deleteItem(gone.item.id);
    EXPECT_FALSE(store.getItem(gone.item.id).has_value());
    EXPECT_FALSE(store.getRecord(gone.record.id).has_value());
    EXPECT_FALSE(store.hasReview(review_id));
    EXPECT_TRUE(store.getItem(keep.item.id).has_value());
    EXPECT_THROW(store.deleteItem(gone.item.id), NotFoundError);

    store.deleteAll();
    EXPECT_EQ(store.counts(T0).total, 0u);
    EXPECT_TRUE(store.allItems().empty());
}

TEST(CardStoreTest, ReplaceAllRejectsOrphans) {
    Scheduler scheduler;
    CardStore store(scheduler);

    StoreSnapshot snap;
    Item item("huis");
    item.id = "w1";
    snap.items.push_back(item);
    EXPECT_THROW(store.replaceAll(snap), ValidationError);

    RetentionRecord record = scheduler.initialRecord("w1", T0);
    record.id = "c1";
    snap.records.push_back(record);
    EXPECT_NO_THROW(store.replaceAll(snap));

    RetentionRecord second = scheduler.initialRecord("w1", T0);
    second.id = "c2";
    snap.records.push_back(second);
    EXPECT_THROW(store.replaceAll(snap), ValidationError);

    // the failed load kept the last good state
    EXPECT_EQ(store.counts(T0).total, 1u);
}

TEST(CardStoreTest, ImportLookups) {
    Scheduler scheduler;
    CardStore store(scheduler);

    NewItem a = dutchWord("de hond", "the dog");
    a.chapter = "3";
    a.group = "Dieren";
    NewItem b = dutchWord("rood", "red");
    b.chapter = "3";
    b.group = "Kleuren";
    NewItem c = dutchWord("het huis", "the house");
    c.chapter = "1";

    store.create(a, T0);
    store.create(b, T0 + 1);
    store.create(c, T0 + 2);

    EXPECT_TRUE(store.wordExists("rood", Language::DUTCH));
    EXPECT_FALSE(store.wordExists("rood", Language::ENGLISH));
    EXPECT_EQ(store.listChapters(), (std::vector<std::string>{ "1", "3" }));
    EXPECT_EQ(store.lastGroupForChapter("3"), std::optional<std::string>("Kleuren"));
    EXPECT_FALSE(store.lastGroupForChapter("1").has_value());
}

TEST(CardStoreTest, ParallelGradesOnDistinctRecords) {
    Scheduler scheduler;
    CardStore store(scheduler);
    std::vector<std::string> ids;
    for (int i = 0; i < 8; ++i) ids.push_back(store.create(dutchWord("w" + std::to_string(i), "x"), T0).record.id);

    std::vector<std::thread> workers;
    for (const auto& id : ids) {
        workers.emplace_back([&store, id] {
            store.applyGrade(id, ReviewQuality::GOOD, T0);
        });
    }
    for (auto& t : workers) t.join();

    for (const auto& id : ids) {
        EXPECT_EQ(store.getRecord(id)->reps, 1);
        EXPECT_EQ(store.reviewsFor(id).size(), 1u);
    }
    EXPECT_EQ(store.counts(T0).due, 0u);
}

TEST(CardStoreTest, InFlightMarkReleasedOnEveryExit) {
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);

    store.applyGrade(card.record.id, ReviewQuality::GOOD, T0);
    EXPECT_NO_THROW(store.applyGrade(card.record.id, ReviewQuality::GOOD, T0 + DAY));

    store.attachPersistence([](const StoreSnapshot&) { return false; });
    EXPECT_THROW(store.applyGrade(card.record.id, ReviewQuality::GOOD, T0 + 2 * DAY), TransientError);

    store.attachPersistence(nullptr);
    RetentionRecord after = store.applyGrade(card.record.id, ReviewQuality::GOOD, T0 + 7 * DAY);
    EXPECT_EQ(after.reps, 3);
    EXPECT_EQ(store.reviewsFor(card.record.id).size(), 3u);
}
