#include "dimforge/tools/CommandConsole.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>

#include "dimforge/core/JobSystem.hpp"
#include "dimforge/levelgen/ChallengeSchedule.hpp"
#include "dimforge/levelgen/LevelFingerprint.hpp"
#include "dimforge/levelgen/LevelIO.hpp"
#include "dimforge/levelgen/LevelRegistry.hpp"
#include "dimforge/levelgen/LevelValidation.hpp"

namespace dimforge::tools
{
namespace
{
using levelgen::GeneratedLevel;
using levelgen::GenerationRequest;

constexpr std::size_t kMaxBatchSize = 10000;

std::string CommandCategoryForUsage(const std::string& usage)
{
    const std::vector<std::string> tokens = Tokenize(usage);
    if (tokens.empty())
    {
        return "General";
    }

    const std::string& command = tokens.front();
    if (command == "generate" || command == "batch" || command == "request_template")
    {
        return "Generation";
    }
    if (command == "daily" || command == "weekly")
    {
        return "Challenges";
    }
    if (command == "lookup" || command == "attempt" || command == "stats")
    {
        return "Registry";
    }
    return "General";
}

bool IsOverrideToken(const std::string& token)
{
    return token.find('=') != std::string::npos;
}

std::optional<std::chrono::year_month_day> ParseDate(const std::string& text)
{
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }
    const auto year = ParseInteger(text.substr(0, 4));
    const auto month = ParseInteger(text.substr(5, 2));
    const auto day = ParseInteger(text.substr(8, 2));
    if (!year || !month || !day || *month < 1 || *day < 1)
    {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{
        std::chrono::year{static_cast<int>(*year)},
        std::chrono::month{static_cast<unsigned>(*month)},
        std::chrono::day{static_cast<unsigned>(*day)},
    };
    if (!date.ok())
    {
        return std::nullopt;
    }
    return date;
}

void PrintLevelSummary(std::ostream& out, const GeneratedLevel& level)
{
    const levelgen::LevelFingerprint& fp = level.fingerprint;
    out << fp.id << "  " << fp.shortCode
        << "  rating=" << std::fixed << std::setprecision(1) << fp.difficultyRating << std::defaultfloat
        << " (" << levelgen::DifficultyTierToText(fp.difficultyTier) << ")"
        << "  nodes=" << level.graph.nodes.size()
        << "  edges=" << level.graph.edges.size()
        << "  portals=" << level.graph.portals.size()
        << "  layers=" << level.layers.size()
        << "  objectives=" << level.objectives.size();
    if (level.multiplayerZones.has_value())
    {
        out << "  zones=" << level.multiplayerZones->size();
    }
    out << (level.diagnostics.connected ? "" : "  DISCONNECTED") << "\n";
}

int ReportIssues(std::ostream& out, const GeneratedLevel& level)
{
    const std::vector<levelgen::ValidationIssue> issues = levelgen::ValidateLevel(level);
    for (const levelgen::ValidationIssue& issue : issues)
    {
        out << "  " << levelgen::IssueSeverityToText(issue.severity) << ": " << issue.message << "\n";
    }
    return levelgen::HasErrors(issues) ? ExitCode::FAILURE : ExitCode::OK;
}

// Splits `generate`-style arguments into a request plus optional output path.
bool BuildRequest(
    const std::vector<std::string>& tokens,
    std::size_t firstArg,
    GenerationRequest* outRequest,
    std::string* outPath,
    bool* outPrintJson,
    std::string* outError
)
{
    GenerationRequest request;

    // A request file is the base; everything else overrides it.
    for (std::size_t i = firstArg; i < tokens.size(); ++i)
    {
        if (tokens[i].rfind("request=", 0) == 0)
        {
            if (!levelgen::LevelIO::ReadGenerationRequestFile(tokens[i].substr(8), &request, outError))
            {
                return false;
            }
        }
    }

    for (std::size_t i = firstArg; i < tokens.size(); ++i)
    {
        const std::string& token = tokens[i];
        if (token.rfind("request=", 0) == 0)
        {
            continue;
        }
        if (token.rfind("out=", 0) == 0)
        {
            if (outPath != nullptr)
            {
                *outPath = token.substr(4);
            }
            continue;
        }
        if (token == "json")
        {
            if (outPrintJson != nullptr)
            {
                *outPrintJson = true;
            }
            continue;
        }
        if (!IsOverrideToken(token))
        {
            if (!ApplyOverride("seed=" + token, request, outError))
            {
                return false;
            }
            continue;
        }
        if (!ApplyOverride(token, request, outError))
        {
            return false;
        }
    }

    *outRequest = request;
    return true;
}

template <typename T>
bool AssignInteger(const std::string& key, const std::string& value, T& target, std::string* outError)
{
    const auto parsed = ParseInteger(value);
    if (!parsed || *parsed < static_cast<long long>(std::numeric_limits<T>::min()) ||
        *parsed > static_cast<long long>(std::numeric_limits<T>::max()))
    {
        if (outError != nullptr)
        {
            *outError = "Invalid integer for " + key + ": " + value;
        }
        return false;
    }
    target = static_cast<T>(*parsed);
    return true;
}

bool AssignNumber(const std::string& key, const std::string& value, double& target, std::string* outError)
{
    const auto parsed = ParseNumber(value);
    if (!parsed)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid number for " + key + ": " + value;
        }
        return false;
    }
    target = *parsed;
    return true;
}
} // namespace

std::vector<std::string> Tokenize(const std::string& text)
{
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::optional<long long> ParseInteger(const std::string& token)
{
    long long value = 0;
    const char* begin = token.data();
    const char* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || token.empty())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<double> ParseNumber(const std::string& token)
{
    double value = 0.0;
    const char* begin = token.data();
    const char* end = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || token.empty())
    {
        return std::nullopt;
    }
    return value;
}

bool ApplyOverride(const std::string& token, GenerationRequest& request, std::string* outError)
{
    const std::size_t split = token.find('=');
    if (split == std::string::npos || split == 0)
    {
        if (outError != nullptr)
        {
            *outError = "Expected key=value, got: " + token;
        }
        return false;
    }

    const std::string key = token.substr(0, split);
    const std::string value = token.substr(split + 1);

    if (key == "seed")
    {
        const auto parsed = ParseInteger(value);
        if (!parsed || !levelgen::LevelIO::SeedFromInteger(*parsed, &request.seed))
        {
            if (outError != nullptr)
            {
                *outError = "Invalid seed: " + value;
            }
            return false;
        }
        return true;
    }
    if (key == "base_node_count") return AssignInteger(key, value, request.config.baseNodeCount, outError);
    if (key == "base_dimension_count") return AssignInteger(key, value, request.config.baseDimensionCount, outError);
    if (key == "difficulty_scale") return AssignNumber(key, value, request.config.difficultyScale, outError);
    if (key == "player_count") return AssignInteger(key, value, request.config.playerCount, outError);
    if (key == "level_progression") return AssignInteger(key, value, request.config.levelProgression, outError);
    if (key == "complexity_tolerance") return AssignNumber(key, value, request.modifiers.complexityTolerance, outError);
    if (key == "exploration_bias") return AssignNumber(key, value, request.modifiers.explorationBias, outError);
    if (key == "witness_affinity") return AssignNumber(key, value, request.modifiers.witnessAffinity, outError);
    if (key == "perception_demand") return AssignNumber(key, value, request.modifiers.perceptionDemand, outError);
    if (key == "time_pressure") return AssignNumber(key, value, request.modifiers.timePressure, outError);
    if (key == "adaptation_level") return AssignNumber(key, value, request.profile.adaptationLevel, outError);
    if (key == "profile_id")
    {
        if (!levelgen::LevelIO::IsValidUtf8(value))
        {
            if (outError != nullptr)
            {
                *outError = "profile_id must be valid UTF-8";
            }
            return false;
        }
        request.profile.profileId = value;
        return true;
    }

    if (outError != nullptr)
    {
        *outError = "Unknown key: " + key;
    }
    return false;
}

CommandConsole::CommandConsole()
{
    RegisterDefaultCommands();
}

void CommandConsole::RegisterCommand(const std::string& usage, const std::string& description, CommandHandler handler)
{
    const std::vector<std::string> tokens = Tokenize(usage);
    if (tokens.empty())
    {
        return;
    }

    m_commandInfos.push_back(CommandInfo{usage, description, CommandCategoryForUsage(usage)});
    m_commandRegistry[tokens.front()] = std::move(handler);
}

bool CommandConsole::HasCommand(const std::string& name) const
{
    return m_commandRegistry.find(name) != m_commandRegistry.end();
}

void CommandConsole::PrintHelp(std::ostream& out) const
{
    out << "Available commands by category:\n";
    std::map<std::string, std::vector<CommandInfo>> grouped;
    for (const CommandInfo& info : m_commandInfos)
    {
        grouped[info.category].push_back(info);
    }

    for (auto& [category, commands] : grouped)
    {
        std::sort(commands.begin(), commands.end(), [](const CommandInfo& a, const CommandInfo& b) {
            return a.usage < b.usage;
        });
        out << "[" << category << "]\n";
        for (const CommandInfo& info : commands)
        {
            out << "  " << info.usage << " - " << info.description << "\n";
        }
    }
}

int CommandConsole::Execute(const std::vector<std::string>& tokens, const ConsoleContext& context) const
{
    std::ostream& err = context.err != nullptr ? *context.err : std::cerr;
    if (tokens.empty())
    {
        return ExitCode::USAGE;
    }

    const auto it = m_commandRegistry.find(tokens.front());
    if (it == m_commandRegistry.end())
    {
        err << "Unknown command: " << tokens.front() << " (try 'help')\n";
        return ExitCode::USAGE;
    }
    return it->second(tokens, context);
}

int CommandConsole::ExecuteLine(const std::string& line, const ConsoleContext& context) const
{
    return Execute(Tokenize(line), context);
}

int CommandConsole::RunInteractive(std::istream& in, const ConsoleContext& context) const
{
    std::ostream& out = context.out != nullptr ? *context.out : std::cout;
    int last = ExitCode::OK;

    std::string line;
    out << "> " << std::flush;
    while (std::getline(in, line))
    {
        const std::vector<std::string> tokens = Tokenize(line);
        if (!tokens.empty())
        {
            if (tokens.front() == "quit" || tokens.front() == "exit")
            {
                break;
            }
            last = Execute(tokens, context);
        }
        out << "> " << std::flush;
    }
    return last;
}

void CommandConsole::RegisterDefaultCommands()
{
    RegisterCommand("help", "List all commands", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        PrintHelp(context.out != nullptr ? *context.out : std::cout);
        return ExitCode::OK;
    });

    RegisterCommand(
        "generate [seed] [key=value...] [request=<file>] [out=<file>] [json]",
        "Generate, validate and register one level",
        [](const std::vector<std::string>& tokens, const ConsoleContext& context) {
            std::ostream& out = *context.out;
            std::ostream& err = *context.err;

            GenerationRequest request;
            std::string outPath;
            bool printJson = false;
            std::string error;
            if (!BuildRequest(tokens, 1, &request, &outPath, &printJson, &error))
            {
                err << "generate: " << error << "\n";
                return ExitCode::USAGE;
            }

            const GeneratedLevel level = context.generator->Generate(request);
            if (context.registry != nullptr)
            {
                context.registry->Register(level.fingerprint, level.parameters);
            }

            PrintLevelSummary(out, level);
            const int status = ReportIssues(out, level);

            if (printJson)
            {
                std::string text;
                if (!levelgen::LevelIO::LevelToJsonText(level, 2, &text, &error))
                {
                    err << "[LevelIO] ERROR - " << error << "\n";
                    return ExitCode::FAILURE;
                }
                out << text << "\n";
            }
            if (!outPath.empty() && !levelgen::LevelIO::WriteLevelFile(outPath, level, &error))
            {
                err << "[LevelIO] ERROR - " << error << "\n";
                return ExitCode::FAILURE;
            }
            return status;
        });

    RegisterCommand(
        "batch <firstSeed> <count> [key=value...]",
        "Generate consecutive seeds on the worker pool",
        [](const std::vector<std::string>& tokens, const ConsoleContext& context) {
            std::ostream& out = *context.out;
            std::ostream& err = *context.err;
            if (tokens.size() < 3)
            {
                err << "usage: batch <firstSeed> <count> [key=value...]\n";
                return ExitCode::USAGE;
            }

            const auto count = ParseInteger(tokens[2]);
            if (!count || *count <= 0 || static_cast<std::size_t>(*count) > kMaxBatchSize)
            {
                err << "batch: count must be in [1, " << kMaxBatchSize << "]\n";
                return ExitCode::USAGE;
            }

            GenerationRequest base;
            std::string error;
            std::vector<std::string> requestTokens{tokens[0], tokens[1]};
            requestTokens.insert(requestTokens.end(), tokens.begin() + 3, tokens.end());
            if (!BuildRequest(requestTokens, 1, &base, nullptr, nullptr, &error))
            {
                err << "batch: " << error << "\n";
                return ExitCode::USAGE;
            }

            std::vector<GeneratedLevel> levels(static_cast<std::size_t>(*count));
            auto generateOne = [&context, &base, &levels](std::size_t index) {
                GenerationRequest request = base;
                request.seed = base.seed + static_cast<std::uint32_t>(index);
                levels[index] = context.generator->Generate(request);
            };

            if (context.jobs != nullptr)
            {
                core::JobCounter counter;
                context.jobs->ParallelFor(levels.size(), 1, generateOne, &counter);
                context.jobs->WaitForCounter(counter);
            }
            else
            {
                for (std::size_t i = 0; i < levels.size(); ++i)
                {
                    generateOne(i);
                }
            }

            int status = ExitCode::OK;
            for (std::size_t i = 0; i < levels.size(); ++i)
            {
                if (context.registry != nullptr)
                {
                    context.registry->Register(levels[i].fingerprint, levels[i].parameters);
                }
                out << "seed " << base.seed + static_cast<std::uint32_t>(i) << ": ";
                PrintLevelSummary(out, levels[i]);
                if (ReportIssues(out, levels[i]) != ExitCode::OK)
                {
                    status = ExitCode::FAILURE;
                }
            }
            return status;
        });

    const auto challengeHandler = [](levelgen::ChallengeKind kind) {
        return [kind](const std::vector<std::string>& tokens, const ConsoleContext& context) {
            std::ostream& out = *context.out;
            std::ostream& err = *context.err;

            std::chrono::year_month_day date = levelgen::ChallengeSchedule::TodayUtc();
            levelgen::DifficultyModifiers modifiers;
            int maxPlayers = levelgen::ChallengeConstants::MAX_PLAYERS;

            for (std::size_t i = 1; i < tokens.size(); ++i)
            {
                if (!IsOverrideToken(tokens[i]))
                {
                    const auto parsed = ParseDate(tokens[i]);
                    if (!parsed)
                    {
                        err << tokens[0] << ": expected YYYY-MM-DD, got " << tokens[i] << "\n";
                        return ExitCode::USAGE;
                    }
                    date = *parsed;
                    continue;
                }

                // Only modifier keys and player_count make sense here.
                GenerationRequest scratch;
                scratch.modifiers = modifiers;
                scratch.config.playerCount = maxPlayers;
                std::string error;
                if (!ApplyOverride(tokens[i], scratch, &error))
                {
                    err << tokens[0] << ": " << error << "\n";
                    return ExitCode::USAGE;
                }
                modifiers = scratch.modifiers;
                maxPlayers = scratch.config.playerCount;
            }

            const levelgen::ChallengeSchedule schedule(*context.generator, context.jobs);
            const std::vector<levelgen::ChallengeLevel> challenges =
                schedule.PregenerateChallenges(kind, date, modifiers, maxPlayers);

            for (const levelgen::ChallengeLevel& challenge : challenges)
            {
                if (context.registry != nullptr)
                {
                    context.registry->Register(challenge.level.fingerprint, challenge.level.parameters);
                }
                out << challenge.playerCount << "P seed " << challenge.request.seed << ": ";
                PrintLevelSummary(out, challenge.level);
            }
            return challenges.empty() ? ExitCode::FAILURE : ExitCode::OK;
        };
    };

    RegisterCommand("daily [YYYY-MM-DD] [key=value...]", "Pregenerate the daily challenge for 1-4 players",
        challengeHandler(levelgen::ChallengeKind::Daily));
    RegisterCommand("weekly [YYYY-MM-DD] [key=value...]", "Pregenerate the weekly elite challenge for 1-4 players",
        challengeHandler(levelgen::ChallengeKind::Weekly));

    RegisterCommand("request_template <file> [key=value...]", "Write a generation request file",
        [](const std::vector<std::string>& tokens, const ConsoleContext& context) {
            std::ostream& err = *context.err;
            if (tokens.size() < 2)
            {
                err << "usage: request_template <file> [key=value...]\n";
                return ExitCode::USAGE;
            }

            GenerationRequest request;
            std::string error;
            for (std::size_t i = 2; i < tokens.size(); ++i)
            {
                if (!ApplyOverride(tokens[i], request, &error))
                {
                    err << "request_template: " << error << "\n";
                    return ExitCode::USAGE;
                }
            }
            if (!levelgen::LevelIO::WriteGenerationRequestFile(tokens[1], request, &error))
            {
                err << "[LevelIO] ERROR - " << error << "\n";
                return ExitCode::FAILURE;
            }
            *context.out << "Wrote " << tokens[1] << "\n";
            return ExitCode::OK;
        });

    RegisterCommand("lookup <shortCode|levelId>", "Find a registered level", [](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        std::ostream& out = *context.out;
        if (tokens.size() < 2 || context.registry == nullptr)
        {
            *context.err << "usage: lookup <shortCode|levelId>\n";
            return ExitCode::USAGE;
        }

        std::optional<levelgen::LevelFingerprint> found = context.registry->Find(tokens[1]);
        if (!found)
        {
            found = context.registry->FindByShortCode(tokens[1]);
        }
        if (!found)
        {
            out << "No level registered for " << tokens[1] << "\n";
            return ExitCode::FAILURE;
        }

        out << levelgen::LevelIO::FingerprintToJson(*found).dump(2) << "\n";
        return ExitCode::OK;
    });

    RegisterCommand("attempt <levelId> completed|failed [seconds]", "Record a play of a registered level",
        [](const std::vector<std::string>& tokens, const ConsoleContext& context) {
            std::ostream& err = *context.err;
            if (tokens.size() < 3 || context.registry == nullptr || (tokens[2] != "completed" && tokens[2] != "failed"))
            {
                err << "usage: attempt <levelId> completed|failed [seconds]\n";
                return ExitCode::USAGE;
            }

            double seconds = 0.0;
            if (tokens.size() > 3)
            {
                const auto parsed = ParseNumber(tokens[3]);
                if (!parsed)
                {
                    err << "attempt: invalid seconds " << tokens[3] << "\n";
                    return ExitCode::USAGE;
                }
                seconds = *parsed;
            }

            if (!context.registry->RecordAttempt(tokens[1], tokens[2] == "completed", seconds))
            {
                return ExitCode::FAILURE;
            }
            const auto updated = context.registry->Find(tokens[1]);
            if (updated)
            {
                *context.out << updated->id << " plays=" << updated->playCount
                             << " completion=" << updated->completionRate
                             << " avgTime=" << updated->averageCompletionTime << "\n";
            }
            return ExitCode::OK;
        });

    RegisterCommand("stats", "Show registry size and worker pool counters", [](const std::vector<std::string>&, const ConsoleContext& context) {
        std::ostream& out = *context.out;
        out << "registered levels: " << (context.registry != nullptr ? context.registry->Size() : 0) << "\n";
        if (context.jobs != nullptr)
        {
            const core::JobStats stats = context.jobs->GetStats();
            out << "workers: " << stats.totalWorkers
                << " completed: " << stats.completedJobs
                << " failed: " << stats.failedJobs
                << " pending: " << stats.pendingJobs << "\n";
        }
        return ExitCode::OK;
    });
}
} // namespace dimforge::tools
