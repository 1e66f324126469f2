/**
 * @file session_store.cpp
 * @brief SessionStore implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/session/session_store.hpp"
#include "agentwatch/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace agentwatch {
namespace session {

namespace {

bool globMatch(const char* text, const char* pattern) {
    // Iterative wildcard match with single-star backtracking.
    const char* star = nullptr;
    const char* resume = nullptr;

    while (*text) {
        if (*pattern == '?' || (*pattern != '*' && *pattern == *text)) {
            ++text;
            ++pattern;
        } else if (*pattern == '*') {
            star = pattern++;
            resume = text;
        } else if (star) {
            pattern = star + 1;
            text = ++resume;
        } else {
            return false;
        }
    }
    while (*pattern == '*') {
        ++pattern;
    }
    return *pattern == '\0';
}

std::optional<proto::PersistedSession> readRecord(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_WARN("Store", "Cannot open {}", path.string());
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    proto::PersistedSession record;
    auto status = google::protobuf::util::JsonStringToMessage(content.str(), &record, options);
    if (!status.ok()) {
        LOG_WARN("Store", "Skipping malformed record {}: {}", path.string(), status.ToString());
        return std::nullopt;
    }
    return record;
}

}  // namespace

StoreConfig StoreConfig::fromEnvironment() {
    if (const char* testHome = std::getenv("OPENCODE_TEST_HOME")) {
        if (*testHome) {
            return StoreConfig{(fs::path(testHome) / "storage").string()};
        }
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw std::runtime_error("HOME is not set; cannot locate session storage");
    }
    return StoreConfig{(fs::path(home) / ".local" / "share" / "opencode" / "storage").string()};
}

std::string StoreConfig::sessionDirectory() const {
    return (fs::path(storage_root) / "session").string();
}

bool matchesPattern(const std::string& directory, const std::string& pattern) {
    if (pattern.find('*') == std::string::npos) {
        return directory == pattern;
    }
    return globMatch(directory.c_str(), pattern.c_str());
}

SessionStore::SessionStore(StoreConfig config)
    : config_(std::move(config))
{}

std::vector<proto::PersistedSession> SessionStore::list(const std::string& pattern) const {
    std::vector<proto::PersistedSession> sessions;
    const fs::path root = config_.sessionDirectory();

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        LOG_DEBUG("Store", "No session directory at {}", root.string());
        return sessions;
    }

    for (const auto& project : fs::directory_iterator(root, ec)) {
        if (!project.is_directory(ec)) {
            continue;
        }

        std::error_code listError;
        for (const auto& file : fs::directory_iterator(project.path(), listError)) {
            if (file.path().extension() != ".json") {
                continue;
            }
            auto record = readRecord(file.path());
            if (!record) {
                continue;
            }
            if (!pattern.empty() && !matchesPattern(record->directory(), pattern)) {
                continue;
            }
            sessions.push_back(std::move(*record));
        }
        if (listError) {
            LOG_WARN("Store", "Cannot list {}: {}", project.path().string(), listError.message());
        }
    }
    if (ec) {
        LOG_WARN("Store", "Cannot list {}: {}", root.string(), ec.message());
    }

    std::stable_sort(sessions.begin(), sessions.end(),
                     [](const proto::PersistedSession& a, const proto::PersistedSession& b) {
                         return a.time().updated() > b.time().updated();
                     });

    LOG_DEBUG("Store", "Listed {} sessions under {}", sessions.size(), root.string());
    return sessions;
}

std::string formatEpochMillis(int64_t epochMs) {
    int64_t seconds = epochMs / 1000;
    int64_t millis = epochMs % 1000;
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

void formatSessionTable(std::ostream& out,
                        const std::vector<proto::PersistedSession>& sessions) {
    if (sessions.empty()) {
        return;
    }

    out << "id\ttitle\tupdated\tdirectory\n";
    for (const auto& session : sessions) {
        std::string title = session.title().empty() ? "Untitled" : session.title();
        std::string escaped;
        for (char c : title) {
            if (c == '\n') {
                escaped += "\\n";
            } else {
                escaped += c;
            }
        }

        out << session.id() << '\t'
            << escaped << '\t'
            << formatEpochMillis(session.time().updated()) << '\t'
            << session.directory() << '\n';
    }
}

}  // namespace session
}  // namespace agentwatch
