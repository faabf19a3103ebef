#include <gtest/gtest.h>
#include "core/SessionManager.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

namespace {

void seed(CardStore& store, int count) {
    for (int i = 0; i < count; ++i) store.create(dutchWord("woord" + std::to_string(i), "word"), T0);
}

// Reviews every card the session hands out; returns how many were graded.
int drain(SessionManager& session, std::time_t now) {
    int graded = 0;
    while (auto card = session.nextDueCard(now)) {
        session.gradeCard(card->record_id, ReviewQuality::GOOD, now);
        ++graded;
    }
    return graded;
}

} // namespace

TEST(SessionManagerTest, EmptyStoreGoesBackToIdle) {
    Scheduler scheduler;
    CardStore store(scheduler);
    SessionManager session(store);

    session.startSession(T0);
    EXPECT_EQ(session.state(), SessionState::ACTIVE);
    EXPECT_FALSE(session.nextDueCard(T0).has_value());
    EXPECT_EQ(session.state(), SessionState::IDLE);
}

TEST(SessionManagerTest, NothingIsServedOutsideActive) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 2);
    SessionManager session(store);

    EXPECT_FALSE(session.nextDueCard(T0).has_value());
    EXPECT_EQ(session.state(), SessionState::IDLE);
}

TEST(SessionManagerTest, CardStaysAtHeadUntilGraded) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 2);
    SessionManager session(store);
    session.startSession(T0);

    auto first = session.nextDueCard(T0);
    auto again = session.nextDueCard(T0);
    ASSERT_TRUE(first && again);
    EXPECT_EQ(first->record_id, again->record_id);
    EXPECT_EQ(first->text, store.getItem(first->item_id)->text);

    session.gradeCard(first->record_id, ReviewQuality::GOOD, T0);
    auto next = session.nextDueCard(T0);
    ASSERT_TRUE(next.has_value());
    EXPECT_NE(next->record_id, first->record_id);
    EXPECT_EQ(session.reviewedCount(), 1u);
}

TEST(SessionManagerTest, CapBoundsEachRunAndOffersPrompt) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 5);
    SessionManager session(store, 3);

    session.startSession(T0);
    EXPECT_EQ(session.queuedCount(), 3u);
    EXPECT_EQ(drain(session, T0), 3);
    EXPECT_EQ(session.state(), SessionState::PROMPT);

    session.continueSession(T0);
    EXPECT_EQ(session.state(), SessionState::ACTIVE);
    EXPECT_EQ(drain(session, T0), 2);
    EXPECT_EQ(session.state(), SessionState::PROMPT);

    session.continueSession(T0);
    EXPECT_FALSE(session.nextDueCard(T0).has_value());
    EXPECT_EQ(session.state(), SessionState::IDLE);
    EXPECT_EQ(store.counts(T0).due, 0u);
}

TEST(SessionManagerTest, EndSessionDiscardsQueueWithoutTouchingRecords) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 4);
    SessionManager session(store);
    session.startSession(T0);

    auto card = session.nextDueCard(T0);
    ASSERT_TRUE(card.has_value());
    StoreSnapshot before = store.snapshot();

    session.endSession();
    EXPECT_EQ(session.state(), SessionState::IDLE);
    EXPECT_EQ(session.queuedCount(), 0u);
    EXPECT_EQ(session.reviewedCount(), 0u);
    EXPECT_FALSE(session.nextDueCard(T0).has_value());
    EXPECT_TRUE(before.equals(store.snapshot()));
}

TEST(SessionManagerTest, DeletedCardsAreSkipped) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 2);
    SessionManager session(store);
    session.startSession(T0);

    auto first = session.nextDueCard(T0);
    ASSERT_TRUE(first.has_value());
    store.deleteItem(first->item_id);

    auto next = session.nextDueCard(T0);
    ASSERT_TRUE(next.has_value());
    EXPECT_NE(next->record_id, first->record_id);
}

TEST(SessionManagerTest, GradeFailureDoesNotCountAsReviewed) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 1);
    SessionManager session(store);
    session.startSession(T0);

    EXPECT_THROW(session.gradeCard("missing", ReviewQuality::GOOD, T0), NotFoundError);
    EXPECT_EQ(session.reviewedCount(), 0u);
    EXPECT_EQ(session.state(), SessionState::ACTIVE);
}

TEST(SessionManagerTest, RedrawRefillsOnlyTheRemainingSlots) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 6);
    SessionManager session(store, 4);
    session.startSession(T0);

    auto card = session.nextDueCard(T0);
    ASSERT_TRUE(card.has_value());
    session.gradeCard(card->record_id, ReviewQuality::GOOD, T0);

    session.redrawQueue(T0);
    EXPECT_EQ(session.state(), SessionState::ACTIVE);
    EXPECT_EQ(session.queuedCount(), 3u);
    EXPECT_EQ(drain(session, T0), 3);
    EXPECT_EQ(session.state(), SessionState::PROMPT);
}

TEST(SessionManagerTest, RedrawOutsideActiveOnlyClears) {
    Scheduler scheduler;
    CardStore store(scheduler);
    seed(store, 2);
    SessionManager session(store);

    session.redrawQueue(T0);
    EXPECT_EQ(session.state(), SessionState::IDLE);
    EXPECT_EQ(session.queuedCount(), 0u);
}
