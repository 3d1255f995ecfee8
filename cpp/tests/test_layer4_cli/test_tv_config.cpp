// tests/test_layer4_cli/test_tv_config.cpp
/**
 * @file test_tv_config.cpp
 * @brief TV registry persistence, default selection and search locations.
 */
#include "cli/tv_config.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

using namespace lgtv::cli;
using namespace lgtv::tests::helper;

namespace
{

TvEntry living_room()
{
    TvEntry entry;
    entry.name = "living";
    entry.ip = "192.168.1.20";
    entry.mac = "a8:23:fe:00:11:22";
    entry.key = "0c7a55";
    return entry;
}

} // namespace

class TvConfigTest : public ::testing::Test
{
  protected:
    TempDir dir_{"tv_config"};
    fs::path file_ = dir_ / "config.json";
};

TEST_F(TvConfigTest, MissingFileLoadsEmpty)
{
    TvConfigStore store(file_);
    ASSERT_TRUE(store.load().is_ok());
    EXPECT_TRUE(store.names().empty());
    EXPECT_FALSE(store.default_tv().has_value());
    EXPECT_FALSE(fs::exists(file_));
}

TEST_F(TvConfigTest, SavedEntriesSurviveReload)
{
    {
        TvConfigStore store(file_);
        ASSERT_TRUE(store.load().is_ok());
        store.put_tv(living_room());
        ASSERT_TRUE(store.set_default("living").is_ok());
        ASSERT_TRUE(store.save().is_ok());
    }

    TvConfigStore reloaded(file_);
    ASSERT_TRUE(reloaded.load().is_ok());
    auto entry = reloaded.get_tv("living");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->ip, "192.168.1.20");
    EXPECT_EQ(entry->mac, "a8:23:fe:00:11:22");
    EXPECT_EQ(entry->key, "0c7a55");
    EXPECT_FALSE(entry->hostname.has_value());
    EXPECT_EQ(reloaded.default_tv(), "living");
    EXPECT_EQ(reloaded.names(), std::vector<std::string>{"living"});

    // Absent optionals are written as null.
    EXPECT_TRUE(reloaded.document()["living"]["hostname"].is_null());

    // No temporary files are left behind.
    size_t files = 0;
    for (const auto &item : fs::directory_iterator(dir_.path()))
    {
        (void)item;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(TvConfigTest, ResolveUsesNameThenDefault)
{
    TvConfigStore store(file_);
    store.put_tv(living_room());
    TvEntry bedroom;
    bedroom.name = "bedroom";
    bedroom.ip = "192.168.1.21";
    store.put_tv(bedroom);

    auto no_default = store.resolve(std::nullopt);
    ASSERT_TRUE(no_default.is_error());
    EXPECT_EQ(no_default.error(), ConfigErrc::NoDefault);

    ASSERT_TRUE(store.set_default("bedroom").is_ok());
    auto by_default = store.resolve(std::nullopt);
    ASSERT_TRUE(by_default.is_ok());
    EXPECT_EQ(by_default.content().ip, "192.168.1.21");

    auto empty_name = store.resolve(std::string());
    ASSERT_TRUE(empty_name.is_ok());
    EXPECT_EQ(empty_name.content().name, "bedroom");

    auto by_name = store.resolve(std::string("living"));
    ASSERT_TRUE(by_name.is_ok());
    EXPECT_EQ(by_name.content().ip, "192.168.1.20");

    auto unknown = store.resolve(std::string("kitchen"));
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error(), ConfigErrc::UnknownTv);
    EXPECT_NE(unknown.error_message().find("kitchen"), std::string::npos);
}

TEST_F(TvConfigTest, DefaultMustNameAKnownTv)
{
    TvConfigStore store(file_);
    auto status = store.set_default("nowhere");
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error(), ConfigErrc::UnknownTv);

    // The reserved key is never a TV.
    EXPECT_FALSE(store.get_tv(TvConfigStore::kDefaultKey).has_value());
    EXPECT_FALSE(store.set_default(TvConfigStore::kDefaultKey).is_ok());
}

TEST_F(TvConfigTest, MalformedFileIsReported)
{
    write_file_contents(file_, "[1, 2, 3]");
    TvConfigStore store(file_);
    auto status = store.load();
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error(), ConfigErrc::Malformed);

    write_file_contents(file_, "{ not json");
    EXPECT_EQ(store.load().error(), ConfigErrc::Malformed);
}

TEST_F(TvConfigTest, EntriesToleratePartialRecords)
{
    write_file_contents(file_, R"({"_default": "old", "old": {"ip": "10.0.0.5", "key": 42}})");
    TvConfigStore store(file_);
    ASSERT_TRUE(store.load().is_ok());
    auto entry = store.resolve(std::nullopt);
    ASSERT_TRUE(entry.is_ok());
    EXPECT_EQ(entry.content().name, "old");
    EXPECT_EQ(entry.content().ip, "10.0.0.5");
    EXPECT_FALSE(entry.content().key.has_value());
    EXPECT_FALSE(entry.content().mac.has_value());
}

TEST_F(TvConfigTest, ExplicitConfigPathComesFirst)
{
    ScopedEnv config("LGTV_CONFIG", file_.string());
    ScopedEnv home("HOME", (dir_ / "home").string());
    ScopedEnv xdg("XDG_CONFIG_HOME", std::nullopt);

    const auto paths = TvConfigStore::search_paths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), file_);
    EXPECT_NE(std::find(paths.begin(), paths.end(), dir_ / "home" / ".config" / "lgtv" / "config.json"),
              paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), dir_ / "home" / ".lgtv" / "config.json"), paths.end());

    auto located = TvConfigStore::locate();
    ASSERT_TRUE(located.is_ok()) << located.error_message();
    EXPECT_EQ(located.content(), file_);
}

TEST_F(TvConfigTest, XdgConfigHomeReplacesDotConfig)
{
    ScopedEnv config("LGTV_CONFIG", std::nullopt);
    ScopedEnv home("HOME", (dir_ / "home").string());
    ScopedEnv xdg("XDG_CONFIG_HOME", (dir_ / "xdg").string());

    const auto paths = TvConfigStore::search_paths();
    EXPECT_NE(std::find(paths.begin(), paths.end(), dir_ / "xdg" / "lgtv" / "config.json"), paths.end());
    EXPECT_EQ(std::find(paths.begin(), paths.end(), dir_ / "home" / ".config" / "lgtv" / "config.json"),
              paths.end());
}
