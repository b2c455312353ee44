#include "gwt/command.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

namespace gwt {

    namespace {

        std::optional<std::string> split_tokens(std::string_view args, std::vector<std::string>* tokens) {
            std::string current;
            bool        in_quotes = false;
            bool        escaped   = false;
            char        quote     = '\0';
            for (const char ch : args) {
                if (escaped) {
                    current.push_back(ch);
                    escaped = false;
                    continue;
                }
                if (in_quotes && ch == '\\') {
                    escaped = true;
                    continue;
                }
                if (in_quotes) {
                    if (ch == quote) {
                        in_quotes = false;
                        continue;
                    }
                    current.push_back(ch);
                    continue;
                }
                if (ch == '"' || ch == '\'') {
                    in_quotes = true;
                    quote     = ch;
                    continue;
                }
                if (std::isspace(static_cast<unsigned char>(ch))) {
                    if (!current.empty()) {
                        tokens->push_back(current);
                        current.clear();
                    }
                    continue;
                }
                current.push_back(ch);
            }
            if (escaped || in_quotes) {
                return std::string("unterminated quote");
            }
            if (!current.empty()) {
                tokens->push_back(std::move(current));
            }
            return std::nullopt;
        }

        std::optional<std::int64_t> parse_non_negative(std::string_view value) {
            std::int64_t parsed = 0;
            const auto   result = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (result.ec != std::errc() || result.ptr != value.data() + value.size() || parsed < 0) {
                return std::nullopt;
            }
            return parsed;
        }

        // Walks `--flag value` pairs; positional tokens are handed back.
        class OptionReader {
          public:
            OptionReader(const std::vector<std::string>& tokens, size_t start) : tokens_(tokens), index_(start) {}

            bool done() const {
                return index_ >= tokens_.size();
            }

            const std::string& next() {
                return tokens_[index_++];
            }

            std::optional<std::string> value() {
                if (done()) {
                    return std::nullopt;
                }
                return tokens_[index_++];
            }

          private:
            const std::vector<std::string>& tokens_;
            size_t                          index_;
        };

        std::optional<ParseError> read_value(OptionReader& reader, const std::string& flag, std::optional<std::string>* out) {
            auto value = reader.value();
            if (!value || value->empty()) {
                return ParseError{"missing value for " + flag};
            }
            *out = std::move(*value);
            return std::nullopt;
        }

        std::optional<ParseError> read_timestamp(OptionReader& reader, const std::string& flag, std::optional<Timestamp>* out) {
            std::optional<std::string> raw;
            if (auto error = read_value(reader, flag, &raw)) {
                return error;
            }
            const auto parsed = parse_non_negative(*raw);
            if (!parsed) {
                return ParseError{"invalid value for " + flag};
            }
            *out = timestamp_from_ms(*parsed);
            return std::nullopt;
        }

        std::optional<ParseError> read_duration(OptionReader& reader, const std::string& flag, std::optional<std::chrono::milliseconds>* out) {
            std::optional<std::string> raw;
            if (auto error = read_value(reader, flag, &raw)) {
                return error;
            }
            const auto parsed = parse_non_negative(*raw);
            if (!parsed || *parsed == 0) {
                return ParseError{"invalid value for " + flag};
            }
            *out = std::chrono::milliseconds(*parsed);
            return std::nullopt;
        }

        bool read_global(const std::string& token, Command& command) {
            if (token == "--json") {
                command.format = OutputFormat::kJson;
                return true;
            }
            if (token == "--debug") {
                command.debug = true;
                return true;
            }
            return false;
        }

        std::variant<Command, ParseError> parse_session(const std::vector<std::string>& tokens, Command command) {
            if (tokens.size() < 2) {
                return ParseError{"missing session subcommand"};
            }
            const auto& sub = tokens[1];
            if (sub == "latest") {
                command.kind = CommandKind::kSessionLatest;
            } else if (sub == "wait") {
                command.kind = CommandKind::kSessionWait;
            } else if (sub == "check") {
                command.kind = CommandKind::kSessionCheck;
            } else {
                return ParseError{"unknown session subcommand"};
            }

            if (tokens.size() < 3) {
                return ParseError{"missing tool id"};
            }
            command.tool = parse_agent_tool(tokens[2]);
            if (!command.tool) {
                return ParseError{"unknown tool: " + tokens[2]};
            }

            OptionReader reader(tokens, 3);
            while (!reader.done()) {
                const auto& token = reader.next();
                if (read_global(token, command)) {
                    continue;
                }
                std::optional<ParseError> error;
                if (token == "--cwd") {
                    error = read_value(reader, token, &command.cwd);
                } else if (token == "--branch") {
                    error = read_value(reader, token, &command.branch);
                } else if (token == "--since") {
                    error = read_timestamp(reader, token, &command.since);
                } else if (token == "--until") {
                    error = read_timestamp(reader, token, &command.until);
                } else if (token == "--prefer") {
                    error = read_timestamp(reader, token, &command.prefer_closest_to);
                } else if (token == "--window") {
                    error = read_duration(reader, token, &command.window);
                } else if (token == "--timeout" && command.kind == CommandKind::kSessionWait) {
                    error = read_duration(reader, token, &command.timeout);
                } else if (token == "--interval" && command.kind == CommandKind::kSessionWait) {
                    error = read_duration(reader, token, &command.poll_interval);
                } else if (token == "--record" && command.kind != CommandKind::kSessionCheck) {
                    command.record = true;
                } else if (command.kind == CommandKind::kSessionCheck && !token.starts_with("--") && !command.session_id) {
                    command.session_id = token;
                } else {
                    return ParseError{"unexpected argument: " + token};
                }
                if (error) {
                    return *error;
                }
            }
            if (command.kind == CommandKind::kSessionCheck && !command.session_id) {
                return ParseError{"missing session id"};
            }
            return command;
        }

        std::variant<Command, ParseError> parse_merge(const std::vector<std::string>& tokens, Command command) {
            command.kind = CommandKind::kMerge;
            OptionReader reader(tokens, 1);
            while (!reader.done()) {
                const auto& token = reader.next();
                if (read_global(token, command)) {
                    continue;
                }
                std::optional<ParseError> error;
                if (token == "--source") {
                    error = read_value(reader, token, &command.source_branch);
                } else if (token == "--remote") {
                    error = read_value(reader, token, &command.remote);
                } else if (token == "--dry-run") {
                    command.dry_run = true;
                } else if (token == "--push") {
                    command.auto_push = true;
                } else if (!token.starts_with("--")) {
                    command.target_branches.push_back(token);
                } else {
                    return ParseError{"unexpected argument: " + token};
                }
                if (error) {
                    return *error;
                }
            }
            return command;
        }

        std::variant<Command, ParseError> parse_history(const std::vector<std::string>& tokens, Command command) {
            command.kind = CommandKind::kHistory;
            OptionReader reader(tokens, 1);
            while (!reader.done()) {
                const auto& token = reader.next();
                if (read_global(token, command)) {
                    continue;
                }
                std::optional<ParseError> error;
                if (token == "--branch") {
                    error = read_value(reader, token, &command.branch);
                } else if (token == "--tool") {
                    std::optional<std::string> raw;
                    error = read_value(reader, token, &raw);
                    if (!error) {
                        command.tool = parse_agent_tool(*raw);
                        if (!command.tool) {
                            return ParseError{"unknown tool: " + *raw};
                        }
                    }
                } else {
                    return ParseError{"unexpected argument: " + token};
                }
                if (error) {
                    return *error;
                }
            }
            return command;
        }

    } // namespace

    std::variant<Command, ParseError> parse_command(const std::vector<std::string>& tokens) {
        if (tokens.empty()) {
            return ParseError{"missing command"};
        }

        Command base{.kind = CommandKind::kHelp};
        if (tokens[0] == "help" || tokens[0] == "--help" || tokens[0] == "-h") {
            return base;
        }
        if (tokens[0] == "session") {
            return parse_session(tokens, base);
        }
        if (tokens[0] == "merge") {
            return parse_merge(tokens, base);
        }
        if (tokens[0] == "history") {
            return parse_history(tokens, base);
        }
        if (tokens[0] == "branches") {
            base.kind = CommandKind::kBranches;
            for (size_t i = 1; i < tokens.size(); ++i) {
                if (!read_global(tokens[i], base)) {
                    return ParseError{"unexpected argument: " + tokens[i]};
                }
            }
            return base;
        }
        return ParseError{"unknown command: " + tokens[0]};
    }

    std::variant<Command, ParseError> parse_command(std::string_view args) {
        std::vector<std::string> tokens;
        if (const auto error = split_tokens(args, &tokens)) {
            return ParseError{*error};
        }
        return parse_command(tokens);
    }

    std::string usage_text() {
        return "usage: gwt <command> [--json] [--debug]\n"
               "\n"
               "  session latest <tool> [--cwd PATH] [--branch NAME] [--since MS] [--until MS]\n"
               "                        [--prefer MS] [--window MS] [--record]\n"
               "  session wait <tool> [--cwd PATH] [--timeout MS] [--interval MS] [--record]\n"
               "  session check <tool> <session-id> [--cwd PATH]\n"
               "  merge [--source BRANCH] [--dry-run] [--push] [--remote NAME] [BRANCH...]\n"
               "  history [--branch NAME] [--tool TOOL]\n"
               "  branches\n"
               "\n"
               "tools: claude-code, codex-cli, gemini-cli, opencode, qwen-cli, custom\n";
    }

} // namespace gwt
