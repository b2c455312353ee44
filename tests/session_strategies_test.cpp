#include <chrono>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "gwt/session_strategies.hpp"

namespace {

    constexpr const char* kUuid      = "0d8b2f3e-5c1a-4b7e-9f00-1234567890ab";
    constexpr const char* kOtherUuid = "aaaaaaaa-bbbb-cccc-dddd-eeeeeeeeeeee";
    constexpr const char* kThirdUuid = "11111111-2222-3333-4444-555555555555";

    class SessionStrategyTest : public ::testing::Test {
      protected:
        void SetUp() override {
            const auto unique = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
            root_             = std::filesystem::temp_directory_path() / ("gwt_strategy_" + unique);
            std::filesystem::create_directories(root_);
        }

        void TearDown() override {
            std::filesystem::remove_all(root_);
        }

        std::filesystem::path write(const std::filesystem::path& relative, const std::string& content, std::int64_t mtime_ms) {
            const auto path = root_ / relative;
            std::filesystem::create_directories(path.parent_path());
            {
                std::ofstream output(path);
                output << content;
            }
            const auto sys = gwt::timestamp_from_ms(mtime_ms);
            std::filesystem::last_write_time(path, std::chrono::file_clock::from_sys(sys));
            return path;
        }

        std::filesystem::path root_;
    };

    std::string json_line(const std::string& id, const std::string& cwd) {
        return "{\"sessionId\":\"" + id + "\",\"cwd\":\"" + cwd + "\"}\n";
    }

} // namespace

TEST(ClaudeEncoding, ProducesDistinctCandidates) {
    EXPECT_EQ(gwt::encode_claude_project_path("/home/me/my_app"), "-home-me-my-app");
    EXPECT_EQ(gwt::encode_claude_project_path("C:\\work\\app"), "C-work-app");

    const auto candidates = gwt::claude_project_path_candidates("/home/me/.config/app");
    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0], "-home-me-.config-app");
    EXPECT_EQ(candidates[1], "-home-me--config-app");
    EXPECT_EQ(candidates[2], "-home-me-config-app");
}

TEST(ClaudeEncoding, DeduplicatesCandidates) {
    EXPECT_EQ(gwt::claude_project_path_candidates("/home/me/app").size(), 1u);
}

TEST_F(SessionStrategyTest, ClaudePrefersSessionsDirectory) {
    write("claude/projects/-work-app/sessions/" + std::string(kUuid) + ".jsonl", "{}", 1'000'000);
    write("claude/projects/-work-app/" + std::string(kOtherUuid) + ".jsonl", "{}", 2'000'000);
    gwt::ClaudeSessionStrategy strategy({root_ / "claude"}, root_ / "claude" / "history.jsonl", nullptr);

    const auto                 found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kUuid);
    EXPECT_EQ(found->mtime, gwt::timestamp_from_ms(1'000'000));
}

TEST_F(SessionStrategyTest, ClaudeSearchesRootsInOrder) {
    write("second/projects/-work-app/" + std::string(kOtherUuid) + ".jsonl", "{}", 5'000'000);
    write("first/projects/-work-app/nested/" + std::string(kUuid) + ".jsonl", "{}", 1'000'000);
    gwt::ClaudeSessionStrategy strategy({root_ / "first", root_ / "second"}, root_ / "history.jsonl", nullptr);

    const auto                 found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kUuid);
}

TEST_F(SessionStrategyTest, ClaudeFallsBackToHistoryNewestLineFirst) {
    const auto history = write("claude/history.jsonl",
                               "{\"project\":\"/work/app\",\"sessionId\":\"" + std::string(kOtherUuid) + "\"}\n"
                               "{\"project\":\"/other\",\"sessionId\":\"" + std::string(kThirdUuid) + "\"}\n"
                               "{\"project\":\"/work/app\",\"sessionId\":\"" + std::string(kUuid) + "\"}\n"
                               "not json\n",
                               3'000'000);
    gwt::ClaudeSessionStrategy strategy({root_ / "claude"}, history, nullptr);

    const auto                 found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kUuid);
    EXPECT_EQ(found->mtime, gwt::timestamp_from_ms(3'000'000));
}

TEST_F(SessionStrategyTest, ClaudeHistoryIgnoresNonUuidIds) {
    const auto history = write("claude/history.jsonl",
                               "{\"project\":\"/work/app\",\"sessionId\":\"" + std::string(kUuid) + "\"}\n"
                               "{\"project\":\"/work/app\",\"sessionId\":\"not a uuid\"}\n",
                               3'000'000);
    gwt::ClaudeSessionStrategy strategy({root_ / "claude"}, history, nullptr);

    const auto                 found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kUuid);
}

TEST_F(SessionStrategyTest, ClaudeHistoryWithOnlyMalformedIdsFindsNothing) {
    const auto history = write("claude/history.jsonl", "{\"project\":\"/work/app\",\"sessionId\":\"not a uuid\"}\n", 3'000'000);
    gwt::ClaudeSessionStrategy strategy({root_ / "claude"}, history, nullptr);

    EXPECT_FALSE(strategy.find_latest({.cwd = std::string("/work/app")}).has_value());
}

TEST_F(SessionStrategyTest, ClaudeBranchSearchUsesWorktreePaths) {
    write("claude/projects/-repo--git-worktree-feature-a/" + std::string(kUuid) + ".jsonl", "{}", 1'000'000);
    gwt::ClaudeSessionStrategy      strategy({root_ / "claude"}, root_ / "history.jsonl", nullptr);
    const gwt::SessionSearchOptions options{
        .cwd       = std::string("/repo"),
        .branch    = std::string("feature/a"),
        .worktrees = std::vector<gwt::WorktreeRef>{{.path = "/repo", .branch = "main"}, {.path = "/repo/.git/worktree/feature-a", .branch = "feature/a"}},
    };

    const auto found = strategy.find_latest(options);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kUuid);
}

TEST_F(SessionStrategyTest, ClaudeUnknownBranchReturnsNothing) {
    write("claude/projects/-repo/" + std::string(kUuid) + ".jsonl", "{}", 1'000'000);
    gwt::ClaudeSessionStrategy      strategy({root_ / "claude"}, root_ / "history.jsonl", nullptr);
    const gwt::SessionSearchOptions options{
        .cwd       = std::string("/repo"),
        .branch    = std::string("feature/missing"),
        .worktrees = std::vector<gwt::WorktreeRef>{{.path = "/repo", .branch = "main"}},
    };

    EXPECT_FALSE(strategy.find_latest(options).has_value());
}

TEST_F(SessionStrategyTest, ClaudeSessionFileExistsRequiresUuid) {
    write("claude/projects/-work-app/sessions/" + std::string(kUuid) + ".jsonl", "{}", 1'000'000);
    gwt::ClaudeSessionStrategy strategy({root_ / "claude"}, root_ / "history.jsonl", nullptr);

    EXPECT_TRUE(strategy.session_file_exists(kUuid, "/work/app"));
    EXPECT_FALSE(strategy.session_file_exists(kOtherUuid, "/work/app"));
    EXPECT_FALSE(strategy.session_file_exists("not-a-uuid", "/work/app"));
}

TEST_F(SessionStrategyTest, CodexTakesIdFromRolloutName) {
    write("codex/2025/01/02/rollout-2025-01-02T10-00-00-" + std::string(kUuid) + ".jsonl", "{\"type\":\"session_meta\"}", 2'000'000);
    write("codex/2025/01/01/rollout-2025-01-01T10-00-00-" + std::string(kOtherUuid) + ".jsonl", "{}", 1'000'000);
    gwt::CodexSessionStrategy strategy(root_ / "codex");

    const auto                found = strategy.find_latest({});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kUuid);
}

TEST_F(SessionStrategyTest, CodexFiltersByPayloadCwd) {
    write("codex/rollout-a-" + std::string(kUuid) + ".jsonl", "{\"payload\":{\"cwd\":\"/elsewhere\"}}\n", 3'000'000);
    write("codex/rollout-b-" + std::string(kOtherUuid) + ".jsonl", "{\"payload\":{\"cwd\":\"/work/app\"}}\n", 2'000'000);
    gwt::CodexSessionStrategy strategy(root_ / "codex");

    const auto                found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kOtherUuid);
}

TEST_F(SessionStrategyTest, CodexKeepsCandidateWithoutCwdAsFallback) {
    write("codex/rollout-a-" + std::string(kUuid) + ".jsonl", "{\"payload\":{\"cwd\":\"/elsewhere\"}}\n", 3'000'000);
    write("codex/rollout-b-" + std::string(kOtherUuid) + ".jsonl", "{\"type\":\"event\"}\n", 2'000'000);
    gwt::CodexSessionStrategy strategy(root_ / "codex");

    const auto                found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kOtherUuid);
}

TEST_F(SessionStrategyTest, CodexWindowingPicksNewestWhenNothingIsClose) {
    write("codex/rollout-a-" + std::string(kUuid) + ".jsonl", "{}", 1'000'000);
    write("codex/rollout-b-" + std::string(kOtherUuid) + ".jsonl", "{}", 9'000'000);
    gwt::CodexSessionStrategy       strategy(root_ / "codex");
    const gwt::SessionSearchOptions options{.prefer_closest_to = gwt::timestamp_from_ms(2'000'000), .window = std::chrono::milliseconds(1'000)};

    const auto                      found = strategy.find_latest(options);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kOtherUuid);
}

TEST_F(SessionStrategyTest, GeminiFiltersByCwd) {
    write("gemini/hash1/chat.json", json_line(kUuid, "/work/other"), 3'000'000);
    write("gemini/hash2/chat.json", json_line(kOtherUuid, "/work/app"), 2'000'000);
    gwt::GeminiSessionStrategy strategy(root_ / "gemini", nullptr);

    const auto                 found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kOtherUuid);
}

TEST_F(SessionStrategyTest, GeminiMapsSessionCwdToBranch) {
    write("gemini/hash1/chat.json", json_line(kUuid, "/repo"), 3'000'000);
    write("gemini/hash2/chat.json", json_line(kOtherUuid, "/repo/.git/worktree/feature-a/src"), 2'000'000);
    gwt::GeminiSessionStrategy      strategy(root_ / "gemini", nullptr);
    const gwt::SessionSearchOptions options{
        .branch    = std::string("feature/a"),
        .worktrees = std::vector<gwt::WorktreeRef>{{.path = "/repo", .branch = "main"}, {.path = "/repo/.git/worktree/feature-a", .branch = "feature/a"}},
    };

    const auto found = strategy.find_latest(options);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kOtherUuid);
}

TEST_F(SessionStrategyTest, GeminiBranchWithoutWorktreesReturnsNothing) {
    write("gemini/hash1/chat.json", json_line(kUuid, "/repo"), 3'000'000);
    gwt::GeminiSessionStrategy strategy(root_ / "gemini", nullptr);

    EXPECT_FALSE(strategy.find_latest({.branch = std::string("main")}).has_value());
}

TEST_F(SessionStrategyTest, OpenCodeMatchesDirectoryField) {
    write("opencode/proj1/" + std::string("ses_one.json"), "{\"id\":\"" + std::string(kUuid) + "\",\"directory\":\"/work/other\"}", 3'000'000);
    write("opencode/proj2/" + std::string("ses_two.json"), "{\"id\":\"" + std::string(kOtherUuid) + "\",\"directory\":\"/work/app\"}", 2'000'000);
    gwt::OpenCodeSessionStrategy strategy(root_ / "opencode");

    const auto                   found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kOtherUuid);
    EXPECT_TRUE(strategy.session_file_exists(kOtherUuid, "/work/app"));
    EXPECT_FALSE(strategy.session_file_exists(kThirdUuid, "/work/app"));
}

TEST_F(SessionStrategyTest, QwenUsesFileStemWhenContentHasNoId) {
    write("qwen/abc123/checkpoints/checkpoint-refactor.json", "[{\"role\":\"user\"}]", 2'000'000);
    gwt::QwenSessionStrategy strategy(root_ / "qwen");

    const auto               found = strategy.find_latest({});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "checkpoint-refactor");
    EXPECT_TRUE(strategy.session_file_exists("checkpoint-refactor", ""));
}

TEST_F(SessionStrategyTest, QwenKeepsWholeStemWhenNameContainsUuid) {
    write("qwen/abc123/checkpoints/checkpoint-" + std::string(kUuid) + ".json", "[]", 2'000'000);
    gwt::QwenSessionStrategy strategy(root_ / "qwen");

    const auto               found = strategy.find_latest({});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "checkpoint-" + std::string(kUuid));
}

TEST_F(SessionStrategyTest, QwenPrefersProjectDirectoryOverCheckpoints) {
    write("qwen/abc123/logs.json", json_line(kUuid, "/work/app"), 1'000'000);
    write("qwen/abc123/checkpoints/checkpoint-later.json", "[]", 5'000'000);
    gwt::QwenSessionStrategy strategy(root_ / "qwen");

    const auto               found = strategy.find_latest({.cwd = std::string("/work/app")});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, kUuid);
}

TEST_F(SessionStrategyTest, QwenSkipsOtherProjects) {
    write("qwen/abc123/logs.json", json_line(kUuid, "/work/other"), 1'000'000);
    gwt::QwenSessionStrategy strategy(root_ / "qwen");

    EXPECT_FALSE(strategy.find_latest({.cwd = std::string("/work/app")}).has_value());
}

TEST(SessionStrategyFactory, CustomToolHasNoStrategy) {
    const gwt::SessionRoots roots{};

    EXPECT_FALSE(gwt::make_session_strategy(gwt::AgentTool::kCustom, roots, nullptr));
    EXPECT_TRUE(gwt::make_session_strategy(gwt::AgentTool::kQwen, roots, nullptr));
}

TEST(AgentToolIds, RoundTripKnownIds) {
    EXPECT_EQ(gwt::parse_agent_tool("claude-code"), gwt::AgentTool::kClaude);
    EXPECT_EQ(gwt::parse_agent_tool("codex-cli"), gwt::AgentTool::kCodex);
    EXPECT_EQ(gwt::parse_agent_tool("qwen-cli"), gwt::AgentTool::kQwen);
    EXPECT_EQ(gwt::parse_agent_tool("vim"), std::nullopt);
    EXPECT_EQ(gwt::agent_tool_id(gwt::AgentTool::kOpenCode), "opencode");
}
