#include "CardStore.hpp"
#include <algorithm>
#include <mutex>
#include <set>
#include <tuple>
#include "Errors.hpp"

// Clears the in-flight mark of a record however applyGrade() exits. The
// success path releases it inside the commit lock; the destructor only locks
// on failure paths, where a lock error would terminate.
class CardStore::InFlightGuard {
public:
    InFlightGuard(CardStore& owner, const std::string& id)
        : store(owner), record_id(id) {}

    ~InFlightGuard() {
        if (!armed) return;
        std::unique_lock<std::shared_mutex> lock(store.mutex);
        store.in_flight.erase(record_id);
    }

    // caller holds the exclusive lock
    void releaseLocked() {
        store.in_flight.erase(record_id);
        armed = false;
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    CardStore& store;
    std::string record_id;
    bool armed = true;
};

static bool reviewBefore(const ReviewEvent& a, const ReviewEvent& b) {
    return std::tie(a.reviewed_at, a.id) < std::tie(b.reviewed_at, b.id);
}

bool StoreSnapshot::equals(const StoreSnapshot& other) const {
    if (items.size() != other.items.size() ||
        records.size() != other.records.size() ||
        reviews.size() != other.reviews.size())
        return false;

    for (size_t i = 0; i < items.size(); ++i)
        if (!items[i].sameContent(other.items[i])) return false;
    for (size_t i = 0; i < records.size(); ++i)
        if (!records[i].sameSchedule(other.records[i])) return false;
    for (size_t i = 0; i < reviews.size(); ++i)
        if (!(reviews[i] == other.reviews[i])) return false;
    return true;
}

CardStore::CardStore(const Scheduler& sched)
    : scheduler(sched)
{
    spdlog::info("CardStore initialized");
}

void CardStore::attachPersistence(StoreSink sink) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    persist_sink = std::move(sink);
    spdlog::debug("CardStore persistence {}", persist_sink ? "attached" : "detached");
}

void CardStore::setBeforeCommitHook(CommitHook hook) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    before_commit_hook = std::move(hook);
}

/* -------------------------
   Write-through & rollback
   -------------------------
   A copy of the state is only taken when a sink is attached: without one the
   in-memory commit cannot fail halfway.
*/
std::optional<CardStore::State> CardStore::backupLocked() const {
    if (!persist_sink) return std::nullopt;
    return state;
}

void CardStore::persistLocked(std::optional<State>& backup, const char* operation) {
    if (!persist_sink) return;

    if (!persist_sink(snapshotLocked())) {
        spdlog::error("Persisting '{}' failed; rolling back in-memory change", operation);
        if (backup) state = std::move(*backup);
        throw TransientError(std::string("failed to persist card store during ") + operation);
    }
}

void CardStore::insertReviewOrdered(std::vector<ReviewEvent>& log, const ReviewEvent& review) {
    auto pos = std::upper_bound(log.begin(), log.end(), review, reviewBefore);
    log.insert(pos, review);
}

CreatedCard CardStore::create(const NewItem& fields, std::time_t now) {
    CreatedCard created;
    created.item.id = Item::generateID();
    created.item.text = fields.text;
    created.item.translation = fields.translation;
    created.item.language = fields.language;
    created.item.chapter = fields.chapter;
    created.item.group = fields.group;
    created.item.sentence = fields.sentence;
    created.item.created_at = now;
    created.record = scheduler.initialRecord(created.item.id, now);

    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto backup = backupLocked();

        state.items[created.item.id] = created.item;
        state.records[created.record.id] = created.record;
        state.record_by_item[created.item.id] = created.record.id;
        state.reviews_by_record[created.record.id];

        persistLocked(backup, "create");
    }

    spdlog::info("Created item {} ('{}') with record {}", created.item.id, created.item.text, created.record.id);
    return created;
}

std::vector<DueCard> CardStore::getDue(std::time_t now) const {
    std::vector<DueCard> due;
    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        for (const auto& entry : state.records) {
            const RetentionRecord& record = entry.second;
            if (record.due_at > now) continue;

            auto item_it = state.items.find(record.item_id);
            if (item_it == state.items.end()) continue;
            due.push_back(DueCard{ record, item_it->second });
        }
    }

    std::sort(due.begin(), due.end(),
        [](const DueCard& a, const DueCard& b) {
            if (a.record.due_at != b.record.due_at) return a.record.due_at < b.record.due_at;
            return a.record.id < b.record.id;
        });
    return due;
}

RetentionRecord CardStore::applyGrade(const std::string& record_id, ReviewQuality q, std::time_t now) {
    RetentionRecord before;
    CommitHook hook;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto it = state.records.find(record_id);
        if (it == state.records.end()) {
            spdlog::warn("applyGrade: unknown record {}", record_id);
            throw NotFoundError("retention record not found: " + record_id);
        }
        if (!in_flight.insert(record_id).second) {
            spdlog::warn("applyGrade: record {} already being graded", record_id);
            throw ConflictError("grade already in flight for record " + record_id);
        }
        before = it->second;
        hook = before_commit_hook;
    }
    InFlightGuard guard(*this, record_id);

    RetentionRecord after = scheduler.transition(before, q, now);
    after.seen_count = before.seen_count + 1;

    ReviewEvent review;
    review.id = Item::generateID();
    review.record_id = record_id;
    review.grade = static_cast<int>(q);
    review.reviewed_at = now;

    if (hook) hook(before, after);

    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto it = state.records.find(record_id);
        if (it == state.records.end()) {
            spdlog::warn("applyGrade: record {} removed while grading", record_id);
            throw NotFoundError("retention record not found: " + record_id);
        }
        auto backup = backupLocked();

        it->second = after;
        insertReviewOrdered(state.reviews_by_record[record_id], review);
        state.review_ids.insert(review.id);

        persistLocked(backup, "applyGrade");
        guard.releaseLocked();
    }

    if (q == ReviewQuality::AGAIN) {
        spdlog::warn("Record {} lapsed: lapses={}, ease={:.2f}", record_id, after.lapses, after.ease);
    }
    spdlog::info("Graded record {} as {}: reps={}, interval={:.3f}d, ease={:.2f}, due_at={}",
        record_id, qualityName(q), after.reps, after.interval_days, after.ease, after.due_at);
    return after;
}

StoreCounts CardStore::counts(std::time_t now) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    StoreCounts c;
    c.total = state.records.size();
    for (const auto& entry : state.records) {
        if (entry.second.due_at <= now) ++c.due;
    }
    return c;
}

Item CardStore::correctContent(const std::string& item_id, const Correction& correction) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = state.items.find(item_id);
    if (it == state.items.end()) {
        throw NotFoundError("item not found: " + item_id);
    }
    if (correction.empty()) {
        spdlog::debug("correctContent: nothing to change for item {}", item_id);
        return it->second;
    }

    auto backup = backupLocked();
    if (correction.text.isSet()) it->second.text = correction.text.value();
    if (correction.translation.isSet()) it->second.translation = correction.translation.value();
    persistLocked(backup, "correctContent");

    spdlog::info("Corrected item {} (text={}, translation={})",
        item_id, correction.text.isSet(), correction.translation.isSet());
    return it->second;
}

void CardStore::eraseItemLocked(const std::string& item_id) {
    auto rec_it = state.record_by_item.find(item_id);
    if (rec_it != state.record_by_item.end()) {
        const std::string record_id = rec_it->second;
        auto log_it = state.reviews_by_record.find(record_id);
        if (log_it != state.reviews_by_record.end()) {
            for (const auto& r : log_it->second) state.review_ids.erase(r.id);
            state.reviews_by_record.erase(log_it);
        }
        state.records.erase(record_id);
        state.record_by_item.erase(rec_it);
    }
    state.items.erase(item_id);
}

void CardStore::deleteItem(const std::string& item_id) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    if (state.items.find(item_id) == state.items.end()) {
        throw NotFoundError("item not found: " + item_id);
    }

    auto backup = backupLocked();
    eraseItemLocked(item_id);
    persistLocked(backup, "deleteItem");

    spdlog::info("Deleted item {} with its record and review log", item_id);
}

void CardStore::deleteAll() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto backup = backupLocked();
    std::size_t removed = state.items.size();
    state = State();
    persistLocked(backup, "deleteAll");

    spdlog::warn("Deleted all {} items", removed);
}

std::optional<Item> CardStore::getItem(const std::string& item_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = state.items.find(item_id);
    if (it == state.items.end()) return std::nullopt;
    return it->second;
}

std::optional<RetentionRecord> CardStore::getRecord(const std::string& record_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = state.records.find(record_id);
    if (it == state.records.end()) return std::nullopt;
    return it->second;
}

std::optional<RetentionRecord> CardStore::recordForItem(const std::string& item_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = state.record_by_item.find(item_id);
    if (it == state.record_by_item.end()) return std::nullopt;
    return state.records.at(it->second);
}

std::vector<ReviewEvent> CardStore::reviewsFor(const std::string& record_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = state.reviews_by_record.find(record_id);
    if (it == state.reviews_by_record.end()) return {};
    return it->second;
}

std::vector<Item> CardStore::allItems() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<Item> out;
    out.reserve(state.items.size());
    for (const auto& entry : state.items) out.push_back(entry.second);
    return out;
}

bool CardStore::hasReview(const std::string& review_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return state.review_ids.count(review_id) > 0;
}

bool CardStore::wordExists(const std::string& text, Language language) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    for (const auto& entry : state.items) {
        if (entry.second.language == language && entry.second.text == text) return true;
    }
    return false;
}

std::vector<std::string> CardStore::listChapters() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::set<std::string> chapters;
    for (const auto& entry : state.items) {
        const auto& chapter = entry.second.chapter;
        if (chapter && !chapter->empty()) chapters.insert(*chapter);
    }
    return std::vector<std::string>(chapters.begin(), chapters.end());
}

std::optional<std::string> CardStore::lastGroupForChapter(const std::string& chapter) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    const Item* latest = nullptr;
    for (const auto& entry : state.items) {
        const Item& item = entry.second;
        if (!item.chapter || *item.chapter != chapter || !item.group) continue;
        if (!latest || item.created_at > latest->created_at ||
            (item.created_at == latest->created_at && item.id > latest->id))
            latest = &item;
    }
    if (!latest) return std::nullopt;
    return latest->group;
}

StoreSnapshot CardStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return snapshotLocked();
}

RetentionRecord CardStore::defaultRecordFor(const std::string& item_id, std::time_t now) const {
    return scheduler.initialRecord(item_id, now);
}

StoreSnapshot CardStore::snapshotLocked() const {
    StoreSnapshot snap;
    snap.items.reserve(state.items.size());
    for (const auto& entry : state.items) snap.items.push_back(entry.second);

    snap.records.reserve(state.records.size());
    for (const auto& entry : state.records) {
        snap.records.push_back(entry.second);
        auto log_it = state.reviews_by_record.find(entry.first);
        if (log_it != state.reviews_by_record.end()) {
            snap.reviews.insert(snap.reviews.end(), log_it->second.begin(), log_it->second.end());
        }
    }
    return snap;
}

void CardStore::replaceAll(const StoreSnapshot& snap) {
    State fresh;
    for (const auto& item : snap.items) {
        if (!fresh.items.emplace(item.id, item).second)
            throw ValidationError("duplicate item id " + item.id);
    }
    for (const auto& record : snap.records) {
        if (fresh.items.find(record.item_id) == fresh.items.end())
            throw ValidationError("record " + record.id + " references unknown item " + record.item_id);
        if (!fresh.record_by_item.emplace(record.item_id, record.id).second)
            throw ValidationError("item " + record.item_id + " has more than one record");
        if (!fresh.records.emplace(record.id, record).second)
            throw ValidationError("duplicate record id " + record.id);
        fresh.reviews_by_record[record.id];
    }
    for (const auto& item : snap.items) {
        if (fresh.record_by_item.find(item.id) == fresh.record_by_item.end())
            throw ValidationError("item " + item.id + " has no retention record");
    }
    for (const auto& review : snap.reviews) {
        auto log_it = fresh.reviews_by_record.find(review.record_id);
        if (log_it == fresh.reviews_by_record.end())
            throw ValidationError("review " + review.id + " references unknown record " + review.record_id);
        if (!fresh.review_ids.insert(review.id).second) continue;
        insertReviewOrdered(log_it->second, review);
    }

    std::unique_lock<std::shared_mutex> lock(mutex);
    state = std::move(fresh);
    spdlog::info("CardStore loaded: {} items, {} records, {} reviews",
        state.items.size(), state.records.size(), state.review_ids.size());
}

/* -------------------------
   Snapshot ingest commit
   -------------------------
   The reconciler validated the plan against a snapshot of this store. The
   checks below catch anything that changed in between (a concurrent create or
   delete) and reject the whole batch so no item is left without its record.
*/
void CardStore::applyIngest(const IngestPlan& plan) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    std::unordered_set<std::string> plan_items;
    for (const auto& item : plan.upsert_items) plan_items.insert(item.id);

    std::unordered_set<std::string> plan_records;
    for (const auto& record : plan.new_records) {
        if (state.records.count(record.id))
            throw ConflictError("record " + record.id + " appeared during ingest");
        if (!plan_items.count(record.item_id) && !state.items.count(record.item_id))
            throw ConflictError("item " + record.item_id + " disappeared during ingest");
        if (state.record_by_item.count(record.item_id))
            throw ConflictError("item " + record.item_id + " gained a record during ingest");
        plan_records.insert(record.id);
    }
    for (const auto& item : plan.upsert_items) {
        if (!state.record_by_item.count(item.id)) {
            bool covered = false;
            for (const auto& record : plan.new_records)
                if (record.item_id == item.id) { covered = true; break; }
            if (!covered)
                throw ConflictError("item " + item.id + " would be left without a record");
        }
    }
    for (const auto& review : plan.new_reviews) {
        if (!plan_records.count(review.record_id) && !state.records.count(review.record_id))
            throw ConflictError("record " + review.record_id + " disappeared during ingest");
    }

    auto backup = backupLocked();

    for (const auto& item : plan.upsert_items) {
        state.items[item.id] = item;
    }
    for (const auto& record : plan.new_records) {
        state.records[record.id] = record;
        state.record_by_item[record.item_id] = record.id;
        state.reviews_by_record[record.id];
    }
    std::size_t appended = 0;
    for (const auto& review : plan.new_reviews) {
        if (!state.review_ids.insert(review.id).second) continue;
        insertReviewOrdered(state.reviews_by_record[review.record_id], review);
        ++appended;
    }

    persistLocked(backup, "applyIngest");

    spdlog::info("Ingest committed: {} items upserted, {} records added, {} reviews appended",
        plan.upsert_items.size(), plan.new_records.size(), appended);
}
