#pragma once
#include <string>
#include <ctime>

// One line-group of the users file.
struct User {
    std::string username;
    std::string password_hash; // Argon2id (crypto_pwhash_str)
    std::string enc_salt;      // hex salt for session key derivation
    std::time_t created_at = 0;
};
