#pragma once
#include <chrono>
#include <string>
#include "Snapshot.hpp"
#include "../auth/AuthSession.hpp"
#include "../core/Correction.hpp"

// The canonical remote copy (system of record for content).
// Implementations throw TransientError on I/O failure or timeout and
// NotFoundError when the remote has no such item.
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual Snapshot fetchSnapshot(const AuthSession& session, std::chrono::milliseconds timeout) = 0;

    virtual void pushCorrection(const AuthSession& session,
        const std::string& item_id,
        const Correction& correction,
        std::chrono::milliseconds timeout) = 0;
};
