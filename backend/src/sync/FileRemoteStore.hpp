#pragma once
#include <mutex>
#include <string>
#include "RemoteStore.hpp"

// Remote copy kept in a directory (an exported data API dump or a shared
// folder):
//   <dir>/snapshot.json     current words/cards/reviews
//   <dir>/corrections.jsonl one line per pushed correction
class FileRemoteStore : public RemoteStore {
public:
    explicit FileRemoteStore(const std::string& directory);

    Snapshot fetchSnapshot(const AuthSession& session, std::chrono::milliseconds timeout) override;

    void pushCorrection(const AuthSession& session,
        const std::string& item_id,
        const Correction& correction,
        std::chrono::milliseconds timeout) override;

    std::string snapshotPath() const;
    std::string correctionLogPath() const;

private:
    std::string dir;
    std::mutex io_mutex;

    std::string readSnapshotText() const;
    void writeSnapshotText(const std::string& text) const;
};
