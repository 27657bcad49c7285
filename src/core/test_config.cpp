// test_config.cpp
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "config.hpp"

using provider_bridge::BridgeConfig;
using provider_bridge::loadConfig;

namespace {

std::string writeTemp(const std::string& name, const std::string& contents) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST(Config, LoadsEveryKey) {
    auto path = writeTemp("pb_cfg_full.json",
        R"({"address": "tcp:127.0.0.1:5000", "pollIntervalMs": 25,
            "logRules": "provider_bridge.*.debug=true"})");

    BridgeConfig cfg;
    std::string err;
    ASSERT_TRUE(loadConfig(path, cfg, &err)) << err;
    EXPECT_TRUE(err.empty());
    EXPECT_EQ(cfg.address, "tcp:127.0.0.1:5000");
    EXPECT_EQ(cfg.pollIntervalMs, 25);
    EXPECT_EQ(cfg.logRules, "provider_bridge.*.debug=true");
    std::remove(path.c_str());
}

TEST(Config, MissingKeysKeepDefaults) {
    auto path = writeTemp("pb_cfg_partial.json", R"({"logRules": "x=true"})");

    BridgeConfig cfg;
    ASSERT_TRUE(loadConfig(path, cfg));
    EXPECT_EQ(cfg.address, BridgeConfig{}.address);
    EXPECT_EQ(cfg.pollIntervalMs, 10);
    std::remove(path.c_str());
}

TEST(Config, UnknownKeyIsOnlyAWarning) {
    auto path = writeTemp("pb_cfg_unknown.json", R"({"pollIntervalMs": 5, "colour": "red"})");

    BridgeConfig cfg;
    std::string err;
    ASSERT_TRUE(loadConfig(path, cfg, &err));
    EXPECT_NE(err.find("colour"), std::string::npos);
    EXPECT_EQ(cfg.pollIntervalMs, 5);
    std::remove(path.c_str());
}

TEST(Config, FailuresLeaveTheConfigUntouched) {
    BridgeConfig cfg;
    cfg.address = "unix:/tmp/keep.sock";
    std::string err;

    EXPECT_FALSE(loadConfig(::testing::TempDir() + "pb_cfg_does_not_exist.json", cfg, &err));
    EXPECT_NE(err.find("Failed to open"), std::string::npos);

    auto broken = writeTemp("pb_cfg_broken.json", "{ not json");
    EXPECT_FALSE(loadConfig(broken, cfg, &err));
    EXPECT_NE(err.find("parse"), std::string::npos);

    auto wrongType = writeTemp("pb_cfg_type.json", R"({"address": "unix:/x", "pollIntervalMs": "fast"})");
    EXPECT_FALSE(loadConfig(wrongType, cfg, &err));

    auto negative = writeTemp("pb_cfg_neg.json", R"({"pollIntervalMs": -1})");
    EXPECT_FALSE(loadConfig(negative, cfg, &err));

    auto array = writeTemp("pb_cfg_array.json", "[1, 2]");
    EXPECT_FALSE(loadConfig(array, cfg, &err));

    EXPECT_EQ(cfg.address, "unix:/tmp/keep.sock");
    EXPECT_EQ(cfg.pollIntervalMs, 10);

    for (auto const& p : {broken, wrongType, negative, array})
        std::remove(p.c_str());
}
