#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "dimforge/levelgen/LevelGenerator.hpp"

namespace dimforge::core
{
class JobSystem;
}

namespace dimforge::levelgen
{
class LevelRegistry;
}

namespace dimforge::tools
{
struct ConsoleContext
{
    const levelgen::LevelGenerator* generator = nullptr;
    levelgen::LevelRegistry* registry = nullptr;
    core::JobSystem* jobs = nullptr;
    std::ostream* out = nullptr;
    std::ostream* err = nullptr;
};

namespace ExitCode
{
    constexpr int OK = 0;
    constexpr int FAILURE = 1;
    constexpr int USAGE = 2;
}

[[nodiscard]] std::vector<std::string> Tokenize(const std::string& text);
[[nodiscard]] std::optional<long long> ParseInteger(const std::string& token);
[[nodiscard]] std::optional<double> ParseNumber(const std::string& token);

/**
 * Applies one `key=value` token to a request. Keys match the request JSON
 * (`base_node_count`, `player_count`, `witness_affinity`, ...) plus `seed`.
 * Returns false with a message for an unknown key or unparsable value.
 */
[[nodiscard]] bool ApplyOverride(const std::string& token, levelgen::GenerationRequest& request, std::string* outError = nullptr);

/**
 * Command registry behind the levelforge tool. Each command is a first token
 * plus handler; the same registry serves argv and the interactive prompt.
 */
class CommandConsole
{
public:
    using CommandHandler = std::function<int(const std::vector<std::string>&, const ConsoleContext&)>;

    CommandConsole();

    // Handlers capture `this`.
    CommandConsole(const CommandConsole&) = delete;
    CommandConsole& operator=(const CommandConsole&) = delete;

    void RegisterCommand(const std::string& usage, const std::string& description, CommandHandler handler);

    // tokens[0] is the command name. Returns an ExitCode value.
    int Execute(const std::vector<std::string>& tokens, const ConsoleContext& context) const;
    int ExecuteLine(const std::string& line, const ConsoleContext& context) const;

    // Reads commands until EOF or `quit`. Returns the last command's exit code.
    int RunInteractive(std::istream& in, const ConsoleContext& context) const;

    void PrintHelp(std::ostream& out) const;

    [[nodiscard]] bool HasCommand(const std::string& name) const;

private:
    struct CommandInfo
    {
        std::string usage;
        std::string description;
        std::string category;
    };

    void RegisterDefaultCommands();

    std::unordered_map<std::string, CommandHandler> m_commandRegistry;
    std::vector<CommandInfo> m_commandInfos;
};
} // namespace dimforge::tools
