#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

// Runtime settings. Defaults are overridden by WORDWISE_* environment
// variables; an unparsable value keeps the default and logs a warning.
struct AppConfig {
    std::string data_dir = ".";
    std::string log_file = "wordwise.log";
    std::string log_level = "info";
    std::size_t session_cap = 10;
    std::string remote_dir;  // empty: sync disabled
    std::chrono::milliseconds sync_timeout{ 5000 };
    int sync_attempts = 3;

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    static AppConfig fromEnvironment();
    static AppConfig fromLookup(const EnvLookup& lookup);

    bool syncEnabled() const { return !remote_dir.empty(); }
};
