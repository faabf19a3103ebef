#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include "RemoteStore.hpp"
#include "Snapshot.hpp"
#include "../auth/AuthSession.hpp"
#include "../core/CardStore.hpp"
#include "../core/Correction.hpp"

struct IngestSummary {
    std::size_t words = 0;
    std::size_t cards = 0;
    std::size_t reviews = 0;
    std::size_t items_upserted = 0;
    std::size_t records_created = 0;
    std::size_t reviews_appended = 0;
};

struct SyncPolicy {
    std::chrono::milliseconds timeout{ 5000 };
    int attempts = 3;
};

/*
  Merges remote snapshots into the local CardStore and pushes content
  corrections outward.

  Merge rules (match by id):
    - content fields: remote wins
    - scheduling fields: local wins, except a record never seen locally is
      seeded from the remote row
    - reviews: union by id, duplicates skipped
  A snapshot is validated as a whole before anything is committed; any bad row
  rejects the batch with ValidationError. Every call requires a valid
  AuthSession and throws AuthRequiredError without touching the store.
*/
class Reconciler {
public:
    Reconciler(CardStore& store, RemoteStore* remote, SyncPolicy policy = SyncPolicy());

    IngestSummary ingestSnapshot(const AuthSession* session, const Snapshot& snapshot);
    IngestSummary ingestSnapshotJson(const AuthSession* session, const std::string& json_text);

    // Pull from the remote and ingest, retrying wholesale on TransientError.
    IngestSummary refreshFromRemote(const AuthSession* session);

    // Remote first, then local. An empty correction is a no-op.
    void pushCorrection(const AuthSession* session, const std::string& item_id, const Correction& correction);

    bool hasRemote() const { return remote != nullptr; }

private:
    CardStore& store;
    RemoteStore* remote;
    SyncPolicy policy;

    void requireSession(const AuthSession* session, const char* operation) const;
    IngestPlan buildPlan(const Snapshot& snapshot, IngestSummary& summary) const;
};
