#include "TempDirTest.hpp"
#include "config/Config.hpp"

using namespace compass::config;

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    const Config cfg;
    EXPECT_EQ(cfg.storage.problemsPath(), std::filesystem::path("data") / "problems.json");
    EXPECT_EQ(cfg.storage.contestsPath(), std::filesystem::path("data") / "contests.json");
    EXPECT_EQ(cfg.storage.solutionsPath(), std::filesystem::path("data") / "solutions");
    EXPECT_EQ(cfg.sync.git_binary, "git");
    EXPECT_EQ(cfg.sync.remote_name, "origin");
    EXPECT_EQ(cfg.sync.default_branch, "main");
    EXPECT_EQ(cfg.sync.command_timeout_seconds, 120u);
    EXPECT_EQ(cfg.logging.file_level, spdlog::level::debug);
}

TEST_F(ConfigTest, LoadsPartialFileOverDefaults) {
    writeText(dir / "config.yaml",
              "storage:\n"
              "  data_dir: /srv/compass\n"
              "sync:\n"
              "  command_timeout_seconds: 30\n"
              "  default_branch: trunk\n");

    const auto cfg = loadConfig(dir / "config.yaml");
    EXPECT_EQ(cfg.storage.data_dir, "/srv/compass");
    EXPECT_EQ(cfg.storage.problems_file, "problems.json");
    EXPECT_EQ(cfg.sync.command_timeout_seconds, 30u);
    EXPECT_EQ(cfg.sync.default_branch, "trunk");
    EXPECT_EQ(cfg.sync.git_binary, "git");
    EXPECT_EQ(cfg.logging.console_level, spdlog::level::warn);
}

TEST_F(ConfigTest, ResolvesRelativePathsAgainstConfigDirectory) {
    writeText(dir / "config.yaml",
              "storage:\n"
              "  data_dir: mydata\n"
              "logging:\n"
              "  log_dir: /var/log/compass\n");

    const auto cfg = loadConfig(dir / "config.yaml");
    EXPECT_EQ(cfg.storage.data_dir, dir / "mydata");
    EXPECT_EQ(cfg.sync.config_cache, dir / ".git_config.json");
    EXPECT_EQ(cfg.logging.log_dir, "/var/log/compass");
}

TEST_F(ConfigTest, ParsesLogLevels) {
    writeText(dir / "config.yaml",
              "logging:\n"
              "  console_level: error\n"
              "  subsystem_levels:\n"
              "    sync: debug\n");

    const auto cfg = loadConfig(dir / "config.yaml");
    EXPECT_EQ(cfg.logging.console_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.subsystem_levels.sync, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.subsystem_levels.storage, spdlog::level::info);
}
