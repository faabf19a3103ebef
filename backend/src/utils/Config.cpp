#include "Config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {

bool parsePositive(const std::string& text, long long& out) {
    if (text.empty()) return false;
    size_t consumed = 0;
    try {
        out = std::stoll(text, &consumed);
    }
    catch (const std::exception&) {
        return false;
    }
    return consumed == text.size() && out > 0;
}

bool validLevel(const std::string& name) {
    return name == "trace" || name == "debug" || name == "info" || name == "warn" ||
        name == "warning" || name == "error" || name == "critical" || name == "off";
}

} // namespace

AppConfig AppConfig::fromEnvironment() {
    return fromLookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    });
}

AppConfig AppConfig::fromLookup(const EnvLookup& lookup) {
    AppConfig config;

    if (auto v = lookup("WORDWISE_DATA_DIR"); v && !v->empty()) config.data_dir = *v;
    if (auto v = lookup("WORDWISE_LOG_FILE"); v && !v->empty()) config.log_file = *v;
    if (auto v = lookup("WORDWISE_REMOTE_DIR")) config.remote_dir = *v;

    if (auto v = lookup("WORDWISE_LOG_LEVEL")) {
        if (validLevel(*v)) config.log_level = *v;
        else spdlog::warn("WORDWISE_LOG_LEVEL '{}' is not a log level; using '{}'", *v, config.log_level);
    }

    long long number = 0;
    if (auto v = lookup("WORDWISE_SESSION_CAP")) {
        if (parsePositive(*v, number)) config.session_cap = static_cast<std::size_t>(number);
        else spdlog::warn("WORDWISE_SESSION_CAP '{}' is invalid; using {}", *v, config.session_cap);
    }
    if (auto v = lookup("WORDWISE_SYNC_TIMEOUT_MS")) {
        if (parsePositive(*v, number)) config.sync_timeout = std::chrono::milliseconds(number);
        else spdlog::warn("WORDWISE_SYNC_TIMEOUT_MS '{}' is invalid; using {}", *v, config.sync_timeout.count());
    }
    if (auto v = lookup("WORDWISE_SYNC_ATTEMPTS")) {
        if (parsePositive(*v, number) && number <= 100) config.sync_attempts = static_cast<int>(number);
        else spdlog::warn("WORDWISE_SYNC_ATTEMPTS '{}' is invalid; using {}", *v, config.sync_attempts);
    }

    return config;
}
