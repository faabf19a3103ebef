#include "Storage.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sodium.h>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include "../core/Errors.hpp"
#include "../sync/Snapshot.hpp"
#include "../utils/TimeUtil.hpp"

static const char MAGIC_HDR[] = "WWDATA1\n";

static std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string Storage::storeFileFor(const std::string& dataDir, const std::string& username) {
    return joinPath(dataDir, "cards_" + username + ".dat");
}

std::string Storage::userFileIn(const std::string& dataDir) {
    return joinPath(dataDir, "users.txt");
}

std::string Storage::issueFileIn(const std::string& dataDir) {
    return joinPath(dataDir, "reported_issues.jsonl");
}

bool Storage::saveUsers(const std::vector<User>& users, const std::string& filename) {
    spdlog::info("Saving {} users to '{}'", users.size(), filename);
    std::ofstream out(filename, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing user data", filename);
        return false;
    }

    for (const auto& u : users) {
        out << u.username << "\n"
            << u.password_hash << "\n"
            << u.enc_salt << "\n"
            << u.created_at << "\n"
            << "---\n";
    }
    return static_cast<bool>(out);
}

bool Storage::loadUsers(std::vector<User>& users, const std::string& filename) {
    users.clear();
    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("User file '{}' not found; treating as empty", filename);
        return false;
    }

    while (true) {
        User u;
        if (!std::getline(in, u.username)) break;
        if (!std::getline(in, u.password_hash)) break;
        if (!std::getline(in, u.enc_salt)) break;
        if (!(in >> u.created_at)) break;

        std::string sep;
        std::getline(in, sep);
        std::getline(in, sep);
        users.push_back(u);
    }

    spdlog::info("Loaded {} users from '{}'", users.size(), filename);
    return true;
}

/* -------------------------
   Card store file
   -------------------------
   Written to "<file>.tmp" and renamed over the target so a crash mid-write
   never leaves a truncated store behind.
*/
bool Storage::saveStore(const StoreSnapshot& snapshot, const std::string& filename, const std::vector<unsigned char>& key) {
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::string plain = SnapshotCodec::serialize(SnapshotCodec::fromStore(snapshot));
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    int rc = crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data());
    sodium_memzero(&plain[0], plain.size());
    if (rc != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            return false;
        }

        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        if (!out.flush()) {
            spdlog::error("Short write to '{}'", tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }

    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to move '{}' into place", tmp);
        std::remove(tmp.c_str());
        return false;
    }

    spdlog::debug("Saved card store ({} items) to '{}'", snapshot.items.size(), filename);
    return true;
}

bool Storage::loadStore(StoreSnapshot& snapshot, const std::string& filename, const std::vector<unsigned char>& key) {
    spdlog::info("Loading encrypted card store from '{}'", filename);
    snapshot = StoreSnapshot();

    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Store file '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(hdr)) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(nonce))) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    sodium_memzero(plain.data(), plain.size());
    try {
        snapshot = SnapshotCodec::toStore(SnapshotCodec::parse(plain_str));
    }
    catch (const ValidationError& e) {
        spdlog::error("Store file '{}' is corrupt: {}", filename, e.what());
        sodium_memzero(&plain_str[0], plain_str.size());
        return false;
    }
    sodium_memzero(&plain_str[0], plain_str.size());

    spdlog::info("Loaded {} items", snapshot.items.size());
    return true;
}

bool Storage::appendIssue(const IssueReport& report, const std::string& filename) {
    Json::Value row(Json::objectValue);
    row["card_id"] = report.record_id;
    row["word_id"] = report.item_id;
    row["text"] = report.text;
    row["translation"] = report.translation ? Json::Value(*report.translation) : Json::Value(Json::nullValue);
    row["note"] = report.note ? Json::Value(*report.note) : Json::Value(Json::nullValue);
    row["reported_at"] = TimeUtil::formatTimestamp(report.reported_at);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    std::ofstream out(filename, std::ios::app);
    if (!out) {
        spdlog::error("Failed to open issue log '{}'", filename);
        return false;
    }
    out << Json::writeString(builder, row) << "\n";
    if (!out) {
        spdlog::error("Failed to append to issue log '{}'", filename);
        return false;
    }

    spdlog::info("Reported issue for card {}", report.record_id);
    return true;
}
