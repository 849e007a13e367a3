#include "TempDirTest.hpp"
#include "sync/ConfigCache.hpp"

#include <nlohmann/json.hpp>

using namespace compass::sync;

class ConfigCacheTest : public TempDirTest {};

TEST_F(ConfigCacheTest, MissingFileYieldsDefaults) {
    const ConfigCache cache(dir / ".git_config.json");
    const auto cfg = cache.load();
    EXPECT_EQ(cfg.remote, "");
    EXPECT_EQ(cfg.branch, "main");

    const ConfigCache trunk(dir / ".git_config.json", "trunk");
    EXPECT_EQ(trunk.load().branch, "trunk");
}

TEST_F(ConfigCacheTest, SaveTrimsAndStamps) {
    const ConfigCache cache(dir / ".git_config.json");
    cache.save("  git@example.com:team/data.git ", " dev ");

    const auto cfg = cache.load();
    EXPECT_EQ(cfg.remote, "git@example.com:team/data.git");
    EXPECT_EQ(cfg.branch, "dev");
    EXPECT_FALSE(cfg.last_updated.empty());

    const auto j = nlohmann::json::parse(readText(dir / ".git_config.json"));
    EXPECT_EQ(j["remote"], "git@example.com:team/data.git");
    EXPECT_TRUE(j.contains("lastUpdated"));
}

TEST_F(ConfigCacheTest, BlankBranchFallsBackToDefault) {
    const ConfigCache cache(dir / ".git_config.json");
    EXPECT_EQ(cache.save("https://example.com/r.git", "   ").branch, "main");
}

TEST_F(ConfigCacheTest, AcceptsLegacyKeys) {
    writeText(dir / ".git_config.json",
              R"({"repo_url": "https://example.com/old.git", "branch": "master", "last_updated": "2024-05-01T10:00:00"})");
    const ConfigCache cache(dir / ".git_config.json");
    const auto cfg = cache.load();
    EXPECT_EQ(cfg.remote, "https://example.com/old.git");
    EXPECT_EQ(cfg.branch, "master");
    EXPECT_EQ(cfg.last_updated, "2024-05-01T10:00:00");
}

TEST_F(ConfigCacheTest, UnreadableFileYieldsDefaults) {
    const ConfigCache cache(dir / ".git_config.json");

    writeText(dir / ".git_config.json", "not json");
    EXPECT_EQ(cache.load().branch, "main");

    writeText(dir / ".git_config.json", R"({"remote": 5, "branch": ["x"]})");
    const auto cfg = cache.load();
    EXPECT_EQ(cfg.remote, "");
    EXPECT_EQ(cfg.branch, "main");
}
