#include "AuthManager.hpp"
#include "../storage/Storage.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>
#include <string>
#include <spdlog/spdlog.h>

// constants for key derivation / pwhash
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

AuthManager::AuthManager(const std::string& userFile)
    : userFilePath(userFile)
{
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
    spdlog::info("AuthManager initialized with user file '{}'", userFilePath);
    loadUsers();
}

AuthManager::~AuthManager() {
    wipeSession();
}

void AuthManager::loadUsers() {
    std::vector<User> loaded;
    Storage::loadUsers(loaded, userFilePath);
    users = std::move(loaded);
    spdlog::info("Loaded {} user entries", users.size());
}

bool AuthManager::saveUsers() {
    spdlog::debug("Saving {} user entries to '{}'", users.size(), userFilePath);
    if (!Storage::saveUsers(users, userFilePath)) {
        spdlog::error("User data could not be saved");
        return false;
    }
    return true;
}

bool AuthManager::save() {
    return saveUsers();
}

std::string AuthManager::hashPassword(const std::string& password) {
    char out[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(
        out,
        password.c_str(),
        static_cast<unsigned long long>(password.size()),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
    {
        spdlog::error("crypto_pwhash_str failed (likely out of memory)");
        throw std::runtime_error("crypto_pwhash_str failed (out of memory)");
    }
    return std::string(out);
}

bool AuthManager::verifyPassword(const std::string& password, const std::string& hash) {
    if (hash.empty()) {
        spdlog::warn("verifyPassword() called with empty hash");
        return false;
    }

    return crypto_pwhash_str_verify(hash.c_str(),
        password.c_str(),
        static_cast<unsigned long long>(password.size())) == 0;
}

static std::string saltToHex(const unsigned char* salt, size_t len) {
    std::string hex(2 * len + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), salt, len);
    hex.resize(2 * len);
    return hex;
}

static bool hexToSalt(const std::string& hex, std::vector<unsigned char>& out) {
    out.resize(SALT_BYTES);
    size_t bin_len = 0;

    if (sodium_hex2bin(out.data(), out.size(),
        hex.c_str(), hex.size(),
        nullptr, &bin_len, nullptr) != 0)
    {
        spdlog::error("Failed to convert hex salt to binary");
        return false;
    }

    if (bin_len != SALT_BYTES) {
        spdlog::error("Salt length mismatch while decoding");
        return false;
    }
    return true;
}

bool AuthManager::deriveSessionKey(const std::string& password, const std::string& salt_hex, std::vector<unsigned char>& key) {
    if (salt_hex.empty()) {
        spdlog::error("Cannot derive session key: salt is empty");
        return false;
    }

    std::vector<unsigned char> salt;
    if (!hexToSalt(salt_hex, salt)) return false;

    key.assign(ENC_KEY_BYTES, 0);
    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        password.c_str(),
        static_cast<unsigned long long>(password.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during session key derivation");
        sodium_memzero(key.data(), key.size());
        key.clear();
        return false;
    }
    return true;
}

bool AuthManager::signup(const std::string& username, const std::string& password) {
    spdlog::info("Attempting signup for username '{}'", username);

    if (username.empty() || password.empty()) {
        spdlog::warn("Signup failed: empty username or password");
        return false;
    }

    for (const auto& u : users) {
        if (u.username == username) {
            spdlog::warn("Signup failed: username '{}' already exists", username);
            return false;
        }
    }

    std::string hashed = hashPassword(password);

    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, SALT_BYTES);

    User user;
    user.username = username;
    user.password_hash = hashed;
    user.enc_salt = saltToHex(salt, SALT_BYTES);
    user.created_at = std::time(nullptr);
    users.push_back(user);
    if (!saveUsers()) {
        users.pop_back();
        return false;
    }

    spdlog::info("Signup successful for username '{}'", username);
    return true;
}

bool AuthManager::login(const std::string& username, const std::string& password) {
    spdlog::info("Login attempt for username '{}'", username);

    for (const auto& u : users) {
        if (u.username != username) continue;

        if (!verifyPassword(password, u.password_hash)) {
            spdlog::warn("Login failed: incorrect password for '{}'", username);
            return false;
        }

        std::vector<unsigned char> key;
        if (!deriveSessionKey(password, u.enc_salt, key)) {
            spdlog::error("Failed to derive session key for '{}'", username);
            return false;
        }

        wipeSession();
        session.username = u.username;
        session.key = std::move(key);
        session.issued_at = std::time(nullptr);

        spdlog::info("User '{}' logged in successfully", username);
        return true;
    }

    spdlog::warn("Login failed: username '{}' not found", username);
    return false;
}

const AuthSession* AuthManager::currentSession() const {
    return session.valid() ? &session : nullptr;
}

void AuthManager::logout() {
    if (session.valid())
        spdlog::info("User '{}' logging out", session.username);
    wipeSession();
}

void AuthManager::wipeSession() {
    if (!session.key.empty()) {
        sodium_memzero(session.key.data(), session.key.size());
    }
    session = AuthSession();
}
