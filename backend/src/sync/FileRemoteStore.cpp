#include "FileRemoteStore.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include "../core/Errors.hpp"
#include "../utils/TimeUtil.hpp"

using Clock = std::chrono::steady_clock;

static void checkDeadline(Clock::time_point start, std::chrono::milliseconds timeout, const char* operation) {
    if (Clock::now() - start > timeout) {
        spdlog::warn("Remote {} exceeded timeout of {} ms", operation, timeout.count());
        throw TransientError(std::string("remote ") + operation + " timed out");
    }
}

FileRemoteStore::FileRemoteStore(const std::string& directory)
    : dir(directory)
{
    spdlog::info("FileRemoteStore using directory '{}'", dir);
}

std::string FileRemoteStore::snapshotPath() const {
    return dir + "/snapshot.json";
}

std::string FileRemoteStore::correctionLogPath() const {
    return dir + "/corrections.jsonl";
}

std::string FileRemoteStore::readSnapshotText() const {
    std::ifstream in(snapshotPath());
    if (!in) {
        spdlog::error("Remote snapshot '{}' is not readable", snapshotPath());
        throw TransientError("remote snapshot unavailable: " + snapshotPath());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

void FileRemoteStore::writeSnapshotText(const std::string& text) const {
    const std::string tmp = snapshotPath() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out || !(out << text) || !out.flush()) {
            std::remove(tmp.c_str());
            throw TransientError("failed to write remote snapshot");
        }
    }
    if (std::rename(tmp.c_str(), snapshotPath().c_str()) != 0) {
        std::remove(tmp.c_str());
        throw TransientError("failed to replace remote snapshot");
    }
}

Snapshot FileRemoteStore::fetchSnapshot(const AuthSession& session, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(io_mutex);
    auto start = Clock::now();
    spdlog::info("Fetching remote snapshot for '{}'", session.username);

    std::string text = readSnapshotText();
    checkDeadline(start, timeout, "fetch");

    return SnapshotCodec::parse(text);
}

void FileRemoteStore::pushCorrection(const AuthSession& session,
    const std::string& item_id,
    const Correction& correction,
    std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(io_mutex);
    auto start = Clock::now();

    Snapshot remote = SnapshotCodec::parse(readSnapshotText());
    bool found = false;
    for (auto& word : remote.words) {
        if (word.id != item_id) continue;
        if (correction.text.isSet()) word.text = correction.text.value();
        if (correction.translation.isSet()) word.translation = correction.translation.value();
        found = true;
        break;
    }
    if (!found) {
        spdlog::warn("Remote has no word {}", item_id);
        throw NotFoundError("word not found in remote store: " + item_id);
    }
    checkDeadline(start, timeout, "correction");

    writeSnapshotText(SnapshotCodec::serialize(remote));

    Json::Value row(Json::objectValue);
    row["word_id"] = item_id;
    row["user"] = session.username;
    row["text"] = correction.text.isSet() ? Json::Value(correction.text.value()) : Json::Value(Json::nullValue);
    row["translation"] = correction.translation.isSet() ? Json::Value(correction.translation.value()) : Json::Value(Json::nullValue);
    row["pushed_at"] = TimeUtil::formatTimestamp(std::time(nullptr));

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::ofstream log(correctionLogPath(), std::ios::app);
    if (!log || !(log << Json::writeString(builder, row) << "\n")) {
        spdlog::error("Correction for {} applied but not logged to '{}'", item_id, correctionLogPath());
    }

    spdlog::info("Pushed correction for word {} to remote", item_id);
}
