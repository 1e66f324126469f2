/**
 * @file zeroconf.cpp
 * @brief ZeroconfConfigurator implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/session/zeroconf.hpp"
#include "agentwatch/utils/logger.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace agentwatch {
namespace session {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> readText(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

std::optional<Struct> parseConfig(const std::string& text, std::string* error = nullptr) {
    Struct config;
    auto status = google::protobuf::util::JsonStringToMessage(text, &config);
    if (!status.ok()) {
        if (error) {
            *error = status.ToString();
        }
        return std::nullopt;
    }
    return config;
}

// True when the file parses and carries server.mdns, whatever its value.
bool hasMdnsSetting(const std::string& path) {
    if (!fileExists(path)) {
        return false;
    }
    auto text = readText(path);
    if (!text) {
        return false;
    }
    auto config = parseConfig(*text);
    if (!config) {
        LOG_DEBUG("Zeroconf", "{} is not valid JSON", path);
        return false;
    }
    auto server = config->fields().find("server");
    if (server == config->fields().end() ||
        server->second.kind_case() != Value::kStructValue) {
        return false;
    }
    return server->second.struct_value().fields().count("mdns") > 0;
}

}  // namespace

ZeroconfPaths ZeroconfPaths::defaults() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        throw std::runtime_error("HOME is not set; cannot locate the agent configuration");
    }
    fs::path base(home);
    return ZeroconfPaths{(base / ".config" / "opencode" / "opencode.json").string(),
                         (base / ".opencode" / "opencode.json").string()};
}

ZeroconfConfigurator::ZeroconfConfigurator(ZeroconfPaths paths)
    : paths_(std::move(paths))
{}

std::string ZeroconfConfigurator::chooseTarget() const {
    if (hasMdnsSetting(paths_.primary)) {
        return paths_.primary;
    }
    if (hasMdnsSetting(paths_.secondary)) {
        return paths_.secondary;
    }

    bool primaryExists = fileExists(paths_.primary);
    bool secondaryExists = fileExists(paths_.secondary);
    if (secondaryExists && !primaryExists) {
        return paths_.secondary;
    }
    return paths_.primary;
}

std::string ZeroconfConfigurator::enable() const {
    std::string target = chooseTarget();
    LOG_DEBUG("Zeroconf", "Updating {}", target);

    Struct config;
    if (fileExists(target)) {
        auto text = readText(target);
        if (!text) {
            throw std::runtime_error("Cannot read " + target);
        }
        std::string error;
        auto parsed = parseConfig(*text, &error);
        if (!parsed) {
            throw std::runtime_error("Malformed JSON in " + target + ": " + error);
        }
        config = std::move(*parsed);
    }

    auto& fields = *config.mutable_fields();
    Value& server = fields["server"];
    if (server.kind_case() != Value::kStructValue) {
        server.mutable_struct_value();
    }
    (*server.mutable_struct_value()->mutable_fields())["mdns"].set_bool_value(true);

    if (fields.find("$schema") == fields.end()) {
        fields["$schema"].set_string_value(SCHEMA_URL);
    }

    std::error_code ec;
    fs::path parent = fs::path(target).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(config, &json, options);
    if (!status.ok()) {
        throw std::runtime_error("Cannot encode configuration: " + status.ToString());
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out || !(out << json)) {
        throw std::runtime_error("Cannot write " + target);
    }

    LOG_INFO("Zeroconf", "Enabled mdns in {}", target);
    return target;
}

}  // namespace session
}  // namespace agentwatch
