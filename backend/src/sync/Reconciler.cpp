#include "Reconciler.hpp"
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include "../core/Errors.hpp"

Reconciler::Reconciler(CardStore& s, RemoteStore* r, SyncPolicy p)
    : store(s), remote(r), policy(p)
{
    if (policy.attempts < 1) policy.attempts = 1;
    spdlog::info("Reconciler initialized (remote={}, timeout={} ms, attempts={})",
        remote ? "configured" : "none", policy.timeout.count(), policy.attempts);
}

void Reconciler::requireSession(const AuthSession* session, const char* operation) const {
    if (!session || !session->valid()) {
        spdlog::warn("{} refused: no authenticated session", operation);
        throw AuthRequiredError(std::string(operation) + " requires a signed-in session");
    }
}

/* -------------------------
   Plan construction
   -------------------------
   Runs against a consistent copy of the local store and never mutates
   anything; every rejection happens here, before the commit.
*/
IngestPlan Reconciler::buildPlan(const Snapshot& snap, IngestSummary& summary) const {
    const StoreSnapshot local = store.snapshot();

    std::unordered_map<std::string, const Item*> local_items;
    for (const auto& item : local.items) local_items[item.id] = &item;

    std::unordered_map<std::string, const RetentionRecord*> local_records;
    std::unordered_map<std::string, std::string> local_record_by_item;
    for (const auto& record : local.records) {
        local_records[record.id] = &record;
        local_record_by_item[record.item_id] = record.id;
    }

    std::unordered_set<std::string> local_reviews;
    for (const auto& review : local.reviews) local_reviews.insert(review.id);

    IngestPlan plan;

    // words: remote content wins
    std::unordered_set<std::string> snapshot_words;
    for (const auto& word : snap.words) {
        if (!snapshot_words.insert(word.id).second)
            throw ValidationError("snapshot lists word " + word.id + " more than once");

        auto it = local_items.find(word.id);
        if (it == local_items.end() || !it->second->sameContent(word)) {
            plan.upsert_items.push_back(word);
        }
    }

    // cards: local scheduling wins; unseen records are seeded from the remote
    std::unordered_set<std::string> snapshot_cards;
    std::unordered_map<std::string, std::string> card_for_word;
    for (const auto& card : snap.cards) {
        if (!snapshot_cards.insert(card.id).second)
            throw ValidationError("snapshot lists card " + card.id + " more than once");

        if (!snapshot_words.count(card.item_id) && !local_items.count(card.item_id))
            throw ValidationError("card " + card.id + " references unknown word " + card.item_id);

        auto claimed = card_for_word.emplace(card.item_id, card.id);
        if (!claimed.second)
            throw ValidationError("word " + card.item_id + " has more than one card in the snapshot");

        auto local_it = local_records.find(card.id);
        if (local_it != local_records.end()) {
            if (local_it->second->item_id != card.item_id)
                throw ValidationError("card " + card.id + " belongs to word " +
                    local_it->second->item_id + " locally, not " + card.item_id);
            continue;
        }

        auto owner = local_record_by_item.find(card.item_id);
        if (owner != local_record_by_item.end())
            throw ValidationError("word " + card.item_id + " already has record " + owner->second +
                "; snapshot card " + card.id + " would orphan it");

        plan.new_records.push_back(card);
    }

    // a word with no card anywhere still gets its record
    for (const auto& word : snap.words) {
        if (card_for_word.count(word.id) || local_record_by_item.count(word.id)) continue;
        plan.new_records.push_back(store.defaultRecordFor(word.id, word.created_at));
        spdlog::debug("Word {} arrived without a card; seeding a default record", word.id);
    }

    // reviews: union by id
    std::unordered_set<std::string> seen_reviews;
    for (const auto& review : snap.reviews) {
        if (!snapshot_cards.count(review.record_id) && !local_records.count(review.record_id))
            throw ValidationError("review " + review.id + " references unknown card " + review.record_id);

        if (!seen_reviews.insert(review.id).second) continue;
        if (local_reviews.count(review.id)) continue;
        plan.new_reviews.push_back(review);
    }

    summary.words = snap.words.size();
    summary.cards = snap.cards.size();
    summary.reviews = snap.reviews.size();
    summary.items_upserted = plan.upsert_items.size();
    summary.records_created = plan.new_records.size();
    summary.reviews_appended = plan.new_reviews.size();
    return plan;
}

IngestSummary Reconciler::ingestSnapshot(const AuthSession* session, const Snapshot& snap) {
    requireSession(session, "ingestSnapshot");

    IngestSummary summary;
    IngestPlan plan = buildPlan(snap, summary);

    if (plan.upsert_items.empty() && plan.new_records.empty() && plan.new_reviews.empty()) {
        spdlog::info("Snapshot already reconciled ({} words, {} cards, {} reviews)",
            summary.words, summary.cards, summary.reviews);
        return summary;
    }

    store.applyIngest(plan);

    spdlog::info("Ingested snapshot for '{}': {} words, {} cards, {} reviews "
        "({} upserted, {} records created, {} reviews appended)",
        session->username, summary.words, summary.cards, summary.reviews,
        summary.items_upserted, summary.records_created, summary.reviews_appended);
    return summary;
}

IngestSummary Reconciler::ingestSnapshotJson(const AuthSession* session, const std::string& json_text) {
    requireSession(session, "ingestSnapshot");
    return ingestSnapshot(session, SnapshotCodec::parse(json_text));
}

IngestSummary Reconciler::refreshFromRemote(const AuthSession* session) {
    requireSession(session, "refreshFromRemote");
    if (!remote) {
        throw std::logic_error("refreshFromRemote called without a remote store");
    }

    for (int attempt = 1;; ++attempt) {
        try {
            Snapshot snap = remote->fetchSnapshot(*session, policy.timeout);
            return ingestSnapshot(session, snap);
        }
        catch (const TransientError& e) {
            if (attempt >= policy.attempts) {
                spdlog::error("Remote refresh failed after {} attempts: {}", attempt, e.what());
                throw;
            }
            spdlog::warn("Remote refresh attempt {} failed: {}; retrying", attempt, e.what());
        }
        catch (const ConflictError& e) {
            if (attempt >= policy.attempts) {
                spdlog::error("Remote refresh kept conflicting after {} attempts: {}", attempt, e.what());
                throw;
            }
            spdlog::warn("Store changed during refresh attempt {}: {}; retrying", attempt, e.what());
        }
    }
}

void Reconciler::pushCorrection(const AuthSession* session, const std::string& item_id, const Correction& correction) {
    requireSession(session, "pushCorrection");

    if (!store.getItem(item_id)) {
        throw NotFoundError("item not found: " + item_id);
    }
    if (correction.empty()) {
        spdlog::debug("pushCorrection: nothing to change for item {}", item_id);
        return;
    }
    if (!remote) {
        throw std::logic_error("pushCorrection called without a remote store");
    }

    remote->pushCorrection(*session, item_id, correction, policy.timeout);
    store.correctContent(item_id, correction);
    spdlog::info("Correction for item {} pushed and applied locally", item_id);
}
