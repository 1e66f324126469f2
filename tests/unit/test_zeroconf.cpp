/**
 * @file test_zeroconf.cpp
 * @brief Unit tests for ZeroconfConfigurator
 */

#include <gtest/gtest.h>
#include <agentwatch/session/zeroconf.hpp>

#include "test_helpers.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iterator>
#include <sstream>

using namespace agentwatch::session;
using agentwatch::testing::TempDir;
using google::protobuf::Struct;

class ZeroconfTest : public ::testing::Test {
protected:
    void SetUp() override {
        paths_.primary = (home_.path() / ".config/opencode/opencode.json").string();
        paths_.secondary = (home_.path() / ".opencode/opencode.json").string();
    }

    Struct readJson(const std::string& path) {
        std::ifstream in(path);
        std::ostringstream content;
        content << in.rdbuf();
        Struct result;
        EXPECT_TRUE(google::protobuf::util::JsonStringToMessage(content.str(), &result).ok());
        return result;
    }

    static bool mdnsEnabled(const Struct& config) {
        auto server = config.fields().find("server");
        if (server == config.fields().end()) {
            return false;
        }
        const auto& fields = server->second.struct_value().fields();
        auto mdns = fields.find("mdns");
        return mdns != fields.end() && mdns->second.bool_value();
    }

    TempDir home_;
    ZeroconfPaths paths_;
};

// =============================================================================
// Target selection
// =============================================================================

TEST_F(ZeroconfTest, DefaultsToPrimary) {
    ZeroconfConfigurator configurator(paths_);
    EXPECT_EQ(configurator.chooseTarget(), paths_.primary);
}

TEST_F(ZeroconfTest, PrefersFileAlreadyCarryingMdns) {
    home_.write(".config/opencode/opencode.json", R"({"theme": "dark"})");
    home_.write(".opencode/opencode.json", R"({"server": {"mdns": false}})");

    ZeroconfConfigurator configurator(paths_);
    EXPECT_EQ(configurator.chooseTarget(), paths_.secondary);
}

TEST_F(ZeroconfTest, PrimaryWinsWhenBothCarryMdns) {
    home_.write(".config/opencode/opencode.json", R"({"server": {"mdns": false}})");
    home_.write(".opencode/opencode.json", R"({"server": {"mdns": true}})");

    ZeroconfConfigurator configurator(paths_);
    EXPECT_EQ(configurator.chooseTarget(), paths_.primary);
}

TEST_F(ZeroconfTest, OnlyExistingSecondaryIsUsed) {
    home_.write(".opencode/opencode.json", R"({"model": "x"})");

    ZeroconfConfigurator configurator(paths_);
    EXPECT_EQ(configurator.chooseTarget(), paths_.secondary);
}

// =============================================================================
// Enabling
// =============================================================================

TEST_F(ZeroconfTest, CreatesConfigWithSchema) {
    ZeroconfConfigurator configurator(paths_);
    EXPECT_EQ(configurator.enable(), paths_.primary);

    auto config = readJson(paths_.primary);
    EXPECT_TRUE(mdnsEnabled(config));
    ASSERT_TRUE(config.fields().count("$schema"));
    EXPECT_EQ(config.fields().at("$schema").string_value(), ZeroconfConfigurator::SCHEMA_URL);
}

TEST_F(ZeroconfTest, PreservesExistingSettings) {
    home_.write(".config/opencode/opencode.json",
                R"({"$schema": "custom", "theme": "dark", "server": {"port": 4096}})");

    ZeroconfConfigurator configurator(paths_);
    configurator.enable();

    auto config = readJson(paths_.primary);
    EXPECT_TRUE(mdnsEnabled(config));
    EXPECT_EQ(config.fields().at("$schema").string_value(), "custom");
    EXPECT_EQ(config.fields().at("theme").string_value(), "dark");
    EXPECT_EQ(config.fields().at("server").struct_value().fields().at("port").number_value(), 4096);
}

TEST_F(ZeroconfTest, ReplacesNonObjectServer) {
    home_.write(".config/opencode/opencode.json", R"({"server": "legacy"})");

    ZeroconfConfigurator configurator(paths_);
    configurator.enable();
    EXPECT_TRUE(mdnsEnabled(readJson(paths_.primary)));
}

TEST_F(ZeroconfTest, MalformedJsonThrows) {
    home_.write(".config/opencode/opencode.json", "{ oops");

    ZeroconfConfigurator configurator(paths_);
    EXPECT_THROW(configurator.enable(), std::runtime_error);

    // The broken file is left untouched.
    std::ifstream in(paths_.primary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "{ oops");
}
