#pragma once
#include <ctime>
#include <string>
#include <vector>

// Proof of a signed-in learner. Passed explicitly to every call that touches
// the remote copy; nothing keeps a process-wide "signed in" flag.
struct AuthSession {
    std::string username;
    std::vector<unsigned char> key;   // derived from the password, never logged
    std::time_t issued_at = 0;

    bool valid() const { return !username.empty() && !key.empty(); }
};
