#pragma once
#include <ctime>
#include <optional>
#include <vector>
#include <string>
#include "../core/CardStore.hpp"
#include "../auth/User.hpp"

// Out-of-band feedback about a card; not part of scheduling.
struct IssueReport {
    std::string record_id;
    std::string item_id;
    std::string text;
    std::optional<std::string> translation;
    std::optional<std::string> note;
    std::time_t reported_at = 0;
};

// Storage handles the users file, the per-user encrypted card store file and
// the issue report log.
//
// For users: text-based safe lines (username, hash, salt_hex, created_at, ---)
// For the card store: encrypted binary format:
//   Header: 8 bytes ASCII "WWDATA1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: snapshot JSON ({"words","cards","reviews"})
// For issue reports: one JSON object per line, appended.
//
// saveStore/loadStore require a derived key of crypto_secretbox_KEYBYTES.
class Storage {
public:
    // USERS (text)
    static bool saveUsers(const std::vector<User>& users, const std::string& filename);
    static bool loadUsers(std::vector<User>& users, const std::string& filename);

    // CARD STORE (encrypted)
    static bool saveStore(const StoreSnapshot& snapshot, const std::string& filename, const std::vector<unsigned char>& key);
    static bool loadStore(StoreSnapshot& snapshot, const std::string& filename, const std::vector<unsigned char>& key);

    // ISSUE REPORTS (JSON lines)
    static bool appendIssue(const IssueReport& report, const std::string& filename);

    static std::string storeFileFor(const std::string& dataDir, const std::string& username);
    static std::string userFileIn(const std::string& dataDir);
    static std::string issueFileIn(const std::string& dataDir);
};
