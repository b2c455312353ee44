#include <gtest/gtest.h>

#include "gwt/paths.hpp"

TEST(PathsResolve, PrefersXdgDirectories) {
    const gwt::EnvConfig env{.home = "/home/tester", .xdg_config_home = "/tmp/xdg", .xdg_data_home = "/tmp/data", .xdg_state_home = "/tmp/state"};
    const auto           paths = gwt::resolve_paths(env);

    EXPECT_EQ(paths.config_dir, std::filesystem::path("/tmp/xdg/gwt"));
    EXPECT_EQ(paths.config_path, std::filesystem::path("/tmp/xdg/gwt/config.json"));
    EXPECT_EQ(paths.state_dir, std::filesystem::path("/tmp/state/gwt"));
    EXPECT_EQ(paths.history_path, std::filesystem::path("/tmp/state/gwt/history.json"));
    EXPECT_EQ(paths.session_roots.opencode_session_dir, std::filesystem::path("/tmp/data/opencode/storage/session"));
}

TEST(PathsResolve, FallsBackToHomeDirectories) {
    const gwt::EnvConfig env{.home = "/home/tester"};
    const auto           paths = gwt::resolve_paths(env);

    EXPECT_EQ(paths.config_path, std::filesystem::path("/home/tester/.config/gwt/config.json"));
    EXPECT_EQ(paths.history_path, std::filesystem::path("/home/tester/.local/state/gwt/history.json"));
    EXPECT_EQ(paths.session_roots.codex_sessions_dir, std::filesystem::path("/home/tester/.codex/sessions"));
    EXPECT_EQ(paths.session_roots.gemini_tmp_dir, std::filesystem::path("/home/tester/.gemini/tmp"));
    EXPECT_EQ(paths.session_roots.qwen_tmp_dir, std::filesystem::path("/home/tester/.qwen/tmp"));
    EXPECT_EQ(paths.session_roots.opencode_session_dir, std::filesystem::path("/home/tester/.local/share/opencode/storage/session"));
    EXPECT_EQ(paths.session_roots.claude_history_path, std::filesystem::path("/home/tester/.claude/history.jsonl"));
}

TEST(PathsResolve, ClaudeConfigDirTakesPriority) {
    const gwt::EnvConfig env{.home = "/home/tester", .claude_config_dir = "/opt/claude"};
    const auto           roots = gwt::resolve_session_roots(env);

    ASSERT_EQ(roots.claude_roots.size(), 3u);
    EXPECT_EQ(roots.claude_roots[0], std::filesystem::path("/opt/claude"));
    EXPECT_EQ(roots.claude_roots[1], std::filesystem::path("/home/tester/.claude"));
    EXPECT_EQ(roots.claude_roots[2], std::filesystem::path("/home/tester/.config/claude"));
}

TEST(PathsResolve, CodexHomeOverridesDefault) {
    const gwt::EnvConfig env{.home = "/home/tester", .codex_home = "/srv/codex"};
    const auto           roots = gwt::resolve_session_roots(env);

    EXPECT_EQ(roots.codex_sessions_dir, std::filesystem::path("/srv/codex/sessions"));
}

TEST(PathsResolve, ReturnsNulloptWithoutHome) {
    const gwt::EnvConfig env{.home = std::nullopt};

    const auto           paths = gwt::try_resolve_paths(env);

    EXPECT_FALSE(paths.has_value());
}
