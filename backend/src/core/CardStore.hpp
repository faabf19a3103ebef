#pragma once
#include <ctime>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <spdlog/spdlog.h>
#include "Item.hpp"
#include "Correction.hpp"
#include "Scheduler.hpp"

struct CreatedCard {
    Item item;
    RetentionRecord record;
};

// A due record joined with its Item.
struct DueCard {
    RetentionRecord record;
    Item item;
};

struct StoreCounts {
    std::size_t due = 0;
    std::size_t total = 0;
};

// Point-in-time copy of the whole store. Items and records are sorted by id,
// reviews by (record_id, reviewed_at, id).
struct StoreSnapshot {
    std::vector<Item> items;
    std::vector<RetentionRecord> records;
    std::vector<ReviewEvent> reviews;

    bool equals(const StoreSnapshot& other) const;
};

// Batch produced by the reconciler and committed in one step.
struct IngestPlan {
    std::vector<Item> upsert_items;            // inserted or content-overwritten
    std::vector<RetentionRecord> new_records;  // records unseen locally
    std::vector<ReviewEvent> new_reviews;      // union by id
};

/*
  Durable keyed storage: one RetentionRecord per Item plus an append-only
  review log per record.

  Reads take a shared lock and only ever see committed state. Every mutation
  is applied under an exclusive lock and, when a sink is attached, written
  through before the lock is released; a failed write rolls the in-memory
  change back and throws TransientError.

  applyGrade() marks a record in flight while the transition is computed, so a
  second grade on the same record throws ConflictError instead of
  interleaving.
*/
class CardStore {
public:
    using StoreSink = std::function<bool(const StoreSnapshot&)>;
    using CommitHook = std::function<void(const RetentionRecord& before, const RetentionRecord& after)>;

    explicit CardStore(const Scheduler& scheduler);

    CreatedCard create(const NewItem& fields, std::time_t now);
    std::vector<DueCard> getDue(std::time_t now) const;
    RetentionRecord applyGrade(const std::string& record_id, ReviewQuality quality, std::time_t now);
    StoreCounts counts(std::time_t now) const;
    Item correctContent(const std::string& item_id, const Correction& correction);
    void deleteItem(const std::string& item_id);
    void deleteAll();

    std::optional<Item> getItem(const std::string& item_id) const;
    std::optional<RetentionRecord> getRecord(const std::string& record_id) const;
    std::optional<RetentionRecord> recordForItem(const std::string& item_id) const;
    std::vector<ReviewEvent> reviewsFor(const std::string& record_id) const;
    std::vector<Item> allItems() const;
    bool hasReview(const std::string& review_id) const;

    bool wordExists(const std::string& text, Language language) const;
    std::vector<std::string> listChapters() const;
    std::optional<std::string> lastGroupForChapter(const std::string& chapter) const;

    StoreSnapshot snapshot() const;

    // The record create() would attach to a new item.
    RetentionRecord defaultRecordFor(const std::string& item_id, std::time_t now) const;

    // Replace the whole state (loading from disk). Throws ValidationError if
    // the snapshot breaks the one-record-per-item or foreign key invariants.
    void replaceAll(const StoreSnapshot& snapshot);

    // Commit a reconciler batch atomically. Throws ConflictError if the store
    // changed underneath the plan in a way that breaks its assumptions.
    void applyIngest(const IngestPlan& plan);

    void attachPersistence(StoreSink sink);

    // Runs between computing a transition and committing it (fault injection).
    void setBeforeCommitHook(CommitHook hook);

private:
    struct State {
        std::map<std::string, Item> items;
        std::map<std::string, RetentionRecord> records;
        std::unordered_map<std::string, std::string> record_by_item;
        std::unordered_map<std::string, std::vector<ReviewEvent>> reviews_by_record;
        std::unordered_set<std::string> review_ids;
    };

    class InFlightGuard;

    Scheduler scheduler;
    mutable std::shared_mutex mutex;
    State state;
    std::unordered_set<std::string> in_flight;
    StoreSink persist_sink;
    CommitHook before_commit_hook;

    StoreSnapshot snapshotLocked() const;
    std::optional<State> backupLocked() const;
    void persistLocked(std::optional<State>& backup, const char* operation);
    void eraseItemLocked(const std::string& item_id);
    static void insertReviewOrdered(std::vector<ReviewEvent>& log, const ReviewEvent& review);
};
