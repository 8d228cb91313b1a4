#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace tsid;

namespace {

std::string write_file(const std::string& name, const std::string& body) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << body;
    return path;
}

} // namespace

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.log_file, "tsid.log");
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_TRUE(cfg.cli_enabled);
    EXPECT_FALSE(cfg.fast);
    EXPECT_EQ(cfg.bench_runs, 100000u);
    EXPECT_EQ(cfg.bench_warmup, 1000u);
    EXPECT_EQ(cfg.bench_batch_runs, 1000u);
    EXPECT_EQ(cfg.bench_batch_size, 100);
    EXPECT_EQ(cfg.bench_threads, 4u);
}

TEST(ConfigTest, LoadsOverrides) {
    std::string path = write_file("tsid_cfg_ok.conf",
        "# tsid test config\n"
        "\n"
        "log_file = /tmp/tsid-test.log\n"
        "log_level=debug\n"
        "cli_enabled = off\n"
        "fast = yes\n"
        "bench_runs = 5000\n"
        "bench_warmup = 10\n"
        "bench_batch_runs = 20\n"
        "bench_batch_size = 10000\n"
        "bench_threads = 2\n");

    Config cfg;
    std::string err;
    ASSERT_TRUE(load_config(path, cfg, err)) << err;
    EXPECT_EQ(cfg.log_file, "/tmp/tsid-test.log");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_FALSE(cfg.cli_enabled);
    EXPECT_TRUE(cfg.fast);
    EXPECT_EQ(cfg.bench_runs, 5000u);
    EXPECT_EQ(cfg.bench_warmup, 10u);
    EXPECT_EQ(cfg.bench_batch_runs, 20u);
    EXPECT_EQ(cfg.bench_batch_size, 10000);
    EXPECT_EQ(cfg.bench_threads, 2u);
}

TEST(ConfigTest, MissingFile) {
    Config cfg;
    std::string err;
    EXPECT_FALSE(load_config(::testing::TempDir() + "tsid_no_such.conf", cfg, err));
    EXPECT_NE(err.find("failed to open config"), std::string::npos);
}

TEST(ConfigTest, RejectsBadLines) {
    struct Case {
        const char* body;
        const char* want;
    };
    const Case cases[] = {
        {"fast\n", "line 1: missing '='"},
        {"# ok\nfast = maybe\n", "line 2: invalid bool"},
        {"colour = blue\n", "unknown config key at line 1: colour"},
        {"log_level = loud\n", "invalid log level"},
        {"bench_runs = lots\n", "bad config value at line 1"},
        {"bench_runs = -3\n", "negative value"},
        {"bench_threads = 0\n", "bench_threads must be > 0"},
        {"bench_runs = 12abc\n", "not a number '12abc'"},
        {"bench_batch_size = 100x\n", "not a number '100x'"},
    };
    int i = 0;
    for (const auto& c : cases) {
        std::string path = write_file("tsid_cfg_bad" + std::to_string(i++) + ".conf", c.body);
        Config cfg;
        std::string err;
        EXPECT_FALSE(load_config(path, cfg, err)) << c.body;
        EXPECT_NE(err.find(c.want), std::string::npos) << "got: " << err;
    }
}
