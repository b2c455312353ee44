#include <chrono>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "gwt/config.hpp"

using namespace std::chrono_literals;

namespace {

    std::filesystem::path make_temp_dir() {
        const auto base   = std::filesystem::temp_directory_path();
        const auto unique = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        auto       dir    = base / ("gwt_config_" + unique);
        std::filesystem::create_directories(dir);
        return dir;
    }

} // namespace

TEST(ConfigOverrides, AppliesOverrides) {
    const gwt::Config          base{};
    const gwt::ConfigOverrides overrides{
        .default_remote        = std::string("upstream"),
        .debug_logging         = true,
        .session_window        = 10min,
        .session_wait_timeout  = 30s,
        .session_poll_interval = 500ms,
    };

    const auto merged = gwt::apply_overrides(base, overrides);

    EXPECT_EQ(merged.default_remote, "upstream");
    EXPECT_TRUE(merged.debug_logging);
    EXPECT_EQ(merged.session_window, 10min);
    EXPECT_EQ(merged.session_wait_timeout, 30s);
    EXPECT_EQ(merged.session_poll_interval, 500ms);
}

TEST(ConfigOverrides, KeepsDefaultsWithoutOverrides) {
    const auto merged = gwt::apply_overrides(gwt::Config{}, gwt::ConfigOverrides{});

    EXPECT_EQ(merged.default_remote, "origin");
    EXPECT_FALSE(merged.debug_logging);
    EXPECT_EQ(merged.session_window, std::chrono::milliseconds(1'800'000));
    EXPECT_EQ(merged.session_wait_timeout, std::chrono::milliseconds(120'000));
    EXPECT_EQ(merged.session_poll_interval, std::chrono::milliseconds(2'000));
}

TEST(ConfigOverrides, NormalizesWhitespaceStrings) {
    EXPECT_EQ(gwt::normalize_override_string("  origin "), std::optional<std::string>("origin"));
    EXPECT_EQ(gwt::normalize_override_string("   "), std::nullopt);
}

TEST(ConfigParse, ReadsAllKeys) {
    std::string error;
    const auto  overrides = gwt::parse_config_overrides(R"({"default_remote":"fork","debug_logging":true,"session":{"window_ms":60000,"wait_timeout_ms":5000,"poll_interval_ms":250}})", &error);

    ASSERT_TRUE(overrides.has_value()) << error;
    EXPECT_EQ(overrides->default_remote, std::optional<std::string>("fork"));
    EXPECT_EQ(overrides->debug_logging, std::optional<bool>(true));
    EXPECT_EQ(overrides->session_window, std::optional<std::chrono::milliseconds>(60s));
    EXPECT_EQ(overrides->session_wait_timeout, std::optional<std::chrono::milliseconds>(5s));
    EXPECT_EQ(overrides->session_poll_interval, std::optional<std::chrono::milliseconds>(250ms));
}

TEST(ConfigParse, RejectsNonPositiveDurations) {
    std::string error;
    const auto  overrides = gwt::parse_config_overrides(R"({"session":{"poll_interval_ms":0}})", &error);

    EXPECT_FALSE(overrides.has_value());
    EXPECT_EQ(error, "invalid poll_interval_ms");
}

TEST(ConfigParse, RejectsInvalidJson) {
    std::string error;
    const auto  overrides = gwt::parse_config_overrides("{nope", &error);

    EXPECT_FALSE(overrides.has_value());
    EXPECT_EQ(error, "invalid config");
}

TEST(ConfigLoad, MissingFileYieldsEmptyOverrides) {
    const auto  dir = make_temp_dir();
    std::string error;

    const auto  overrides = gwt::load_config_overrides(dir / "config.json", &error);

    ASSERT_TRUE(overrides.has_value());
    EXPECT_TRUE(error.empty());
    EXPECT_FALSE(overrides->default_remote.has_value());
    std::filesystem::remove_all(dir);
}

TEST(ConfigLoad, ReadsFileFromDisk) {
    const auto dir  = make_temp_dir();
    const auto path = dir / "config.json";
    {
        std::ofstream output(path);
        output << R"({"default_remote":"mirror"})";
    }
    std::string error;

    const auto  overrides = gwt::load_config_overrides(path, &error);

    ASSERT_TRUE(overrides.has_value());
    EXPECT_EQ(overrides->default_remote, std::optional<std::string>("mirror"));
    std::filesystem::remove_all(dir);
}
