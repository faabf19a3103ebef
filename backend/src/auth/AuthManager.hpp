#pragma once

#include <string>
#include <vector>
#include "User.hpp"
#include "AuthSession.hpp"

// Local learner accounts. A successful login yields an AuthSession that the
// caller threads into sync calls; logout wipes the derived key.
class AuthManager {
public:
    explicit AuthManager(const std::string& userFile = "users.txt");
    ~AuthManager();

    bool signup(const std::string& username, const std::string& password);
    bool login(const std::string& username, const std::string& password);
    void logout();

    // nullptr when nobody is signed in
    const AuthSession* currentSession() const;

    // Persist users to disk
    bool save();

private:
    std::vector<User> users;
    std::string userFilePath;
    AuthSession session;

    void loadUsers();
    bool saveUsers();

    // Password hashing / verification (libsodium)
    std::string hashPassword(const std::string& password);
    bool verifyPassword(const std::string& password, const std::string& hash);

    // Derive the session key from password + the user's salt (stored as hex)
    bool deriveSessionKey(const std::string& password, const std::string& salt_hex, std::vector<unsigned char>& key);
    void wipeSession();
};
