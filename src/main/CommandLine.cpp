// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/CommandLine.h"
#include "fuzzer/FuzzSession.h"
#include "main/Config.h"
#include "main/PotfuzzVersion.h"

#include <algorithm>
#include <clara.hpp>
#include <fmt/format.h>
#include <functional>
#include <iostream>
#include <optional>

namespace potfuzz
{

void
writeWithTextFlow(std::ostream& os, std::string const& text)
{
    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    os << clara::TextFlow::Column(text).width(consoleWidth) << "\n\n";
}

namespace
{

class CommandLine
{
  public:
    struct ConfigOption
    {
        using Common = std::pair<std::string, bool>;
        static const std::vector<Common> COMMON_OPTIONS;

        LogLevel mLogLevel{LogLevel::LVL_INFO};
        std::string mConfigFile;

        Config getConfig() const;
    };

    class Command
    {
      public:
        using RunFunc = std::function<int(CommandLineArgs const& args)>;

        Command(std::string const& name, std::string const& description,
                RunFunc const& runFunc);
        int run(CommandLineArgs const& args) const;
        std::string name() const;
        std::string description() const;

      private:
        std::string mName;
        std::string mDescription;
        RunFunc mRunFunc;
    };

    explicit CommandLine(std::vector<Command> const& commands);

    using AdjustedCommandLine =
        std::pair<std::string, std::vector<std::string>>;
    AdjustedCommandLine adjustCommandLine(clara::detail::Args const& args);
    std::optional<Command> selectCommand(std::string const& commandName);
    void writeToStream(std::string const& exeName, std::ostream& os) const;

  private:
    std::vector<Command> mCommands;
};

const std::vector<std::pair<std::string, bool>>
    CommandLine::ConfigOption::COMMON_OPTIONS{
        {"--conf", true}, {"--ll", true}, {"--help", false}};

class ParserWithValidation
{
  public:
    ParserWithValidation(
        clara::Parser parser,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = parser;
        mIsValid = isValid;
    }

    ParserWithValidation(
        clara::Arg arg,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = clara::Parser{} | arg;
        mIsValid = isValid;
    }

    ParserWithValidation(
        clara::Opt opt,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = clara::Parser{} | opt;
        mIsValid = isValid;
    }

    const clara::Parser&
    parser() const
    {
        return mParser;
    }

    std::string
    validate() const
    {
        return mIsValid();
    }

  private:
    clara::Parser mParser;
    std::function<std::string()> mIsValid;
};

template <typename T>
std::function<std::string()>
required(T& value, std::string const& name)
{
    return [&value, name] {
        if (value.empty())
        {
            return name + " argument is required";
        }
        else
        {
            return std::string{};
        };
    };
}

template <typename T>
ParserWithValidation
requiredArgParser(T& value, std::string const& name)
{
    return {clara::Arg(value, name).required(), required(value, name)};
}

ParserWithValidation
targetParser(std::string& target)
{
    return requiredArgParser(target, "TARGET");
}

clara::Opt
logLevelParser(LogLevel& value)
{
    return clara::Opt{
        [&](std::string const& arg) { value = Logging::getLLfromString(arg); },
        "LEVEL"}["--ll"]("set the log level");
}

clara::Opt
iterationsParser(std::optional<uint64_t>& iterations)
{
    return clara::Opt{
        [&](std::string const& arg) { iterations = std::stoull(arg); },
        "N"}["--iterations"](
        "number of seeds to try (default DEFAULT_ITERATIONS, 1000000)");
}

clara::Opt
initialSeedParser(std::optional<uint64_t>& seed)
{
    return clara::Opt{[&](std::string const& arg) { seed = std::stoull(arg); },
                      "SEED"}["--initial-seed"](
        "seed for the generator producing target seeds (default random)");
}

clara::Parser
configurationParser(CommandLine::ConfigOption& configOption)
{
    return logLevelParser(configOption.mLogLevel) |
           clara::Opt{configOption.mConfigFile,
                      "FILE-NAME"}["--conf"](fmt::format(
               FMT_STRING("specify a config file ('{}' for STDIN, default "
                          "none)"),
               Config::STDIN_SPECIAL_NAME));
}

int
runWithHelp(CommandLineArgs const& args,
            std::vector<ParserWithValidation> parsers, std::function<int()> f)
{
    auto isHelp = false;
    auto parser = clara::Parser{} | clara::Help(isHelp);
    for (auto const& p : parsers)
        parser |= p.parser();
    auto errorMessage =
        parser
            .parse(args.mCommandName,
                   clara::detail::TokenStream{std::begin(args.mArgs),
                                              std::end(args.mArgs)})
            .errorMessage();
    if (errorMessage.empty() && !isHelp)
    {
        for (auto const& p : parsers)
        {
            errorMessage = p.validate();
            if (!errorMessage.empty())
            {
                break;
            }
        }
    }

    if (!errorMessage.empty())
    {
        writeWithTextFlow(std::cerr, errorMessage);
        writeWithTextFlow(std::cerr, args.mCommandDescription);
        parser.writeToStream(std::cerr);
        return 1;
    }

    if (isHelp)
    {
        writeWithTextFlow(std::cout, args.mCommandDescription);
        parser.writeToStream(std::cout);
        return 0;
    }

    return f();
}

CommandLine::Command::Command(std::string const& name,
                              std::string const& description,
                              RunFunc const& runFunc)
    : mName{name}, mDescription{description}, mRunFunc{runFunc}
{
}

int
CommandLine::Command::run(CommandLineArgs const& args) const
{
    return mRunFunc(args);
}

std::string
CommandLine::Command::name() const
{
    return mName;
}

std::string
CommandLine::Command::description() const
{
    return mDescription;
}

Config
CommandLine::ConfigOption::getConfig() const
{
    Config config;

    // yes you really have to do this 3 times
    Logging::setLogLevel(mLogLevel, nullptr);
    if (!mConfigFile.empty())
    {
        LOG_INFO(DEFAULT_LOG, "Config from {}", mConfigFile);
        config.load(mConfigFile);
    }

    Logging::setFmt("potfuzz");
    Logging::setLogLevel(mLogLevel, nullptr);

    if (!config.LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(config.LOG_FILE_PATH);
    }
    if (config.LOG_COLOR)
    {
        Logging::setLoggingColor(true);
    }
    Logging::setLogLevel(mLogLevel, nullptr);
    return config;
}

CommandLine::CommandLine(std::vector<Command> const& commands)
    : mCommands{commands}
{
    mCommands.push_back(Command{"help", "display list of available commands",
                                [this](CommandLineArgs const& args) {
                                    writeToStream(args.mExeName, std::cout);
                                    return 0;
                                }});

    std::sort(
        std::begin(mCommands), std::end(mCommands),
        [](Command const& x, Command const& y) { return x.name() < y.name(); });
}

CommandLine::AdjustedCommandLine
CommandLine::adjustCommandLine(clara::detail::Args const& args)
{
    auto tokens = clara::detail::TokenStream{args};
    auto command = std::string{};
    auto remainingTokens = std::vector<std::string>{};
    auto found = false;
    auto optionValue = false;

    while (tokens)
    {
        auto token = *tokens;
        if (found || optionValue)
        {
            remainingTokens.push_back(token.token);
            optionValue = false;
        }
        else if (token.type == clara::detail::TokenType::Argument)
        {
            command = token.token;
            found = true;
        }
        else // clara::detail::TokenType::Option
        {
            auto commonIt =
                std::find_if(std::begin(ConfigOption::COMMON_OPTIONS),
                             std::end(ConfigOption::COMMON_OPTIONS),
                             [&](ConfigOption::Common const& option) {
                                 return token.token == option.first;
                             });
            if (commonIt != std::end(ConfigOption::COMMON_OPTIONS))
            {
                remainingTokens.push_back(token.token);
                optionValue = commonIt->second;
            }
            else
            {
                // Unknown option before the command: show help.
                return {};
            }
        }
        ++tokens;
    }

    return CommandLine::AdjustedCommandLine{command, remainingTokens};
}

std::optional<CommandLine::Command>
CommandLine::selectCommand(std::string const& commandName)
{
    auto command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == commandName; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }

    command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == "help"; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }
    return std::nullopt;
}

void
CommandLine::writeToStream(std::string const& exeName, std::ostream& os) const
{
    os << "usage:\n"
       << "  " << exeName << " "
       << "COMMAND";
    os << "\n\nwhere COMMAND is one of following:" << std::endl;

    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    size_t commandWidth = 0;
    for (auto const& command : mCommands)
        commandWidth = std::max(commandWidth, command.name().size() + 2);

    commandWidth = std::min(commandWidth, consoleWidth / 2);

    for (auto const& command : mCommands)
    {
        auto row = clara::TextFlow::Column(command.name())
                       .width(commandWidth)
                       .indent(2) +
                   clara::TextFlow::Spacer(4) +
                   clara::TextFlow::Column(command.description())
                       .width(consoleWidth - 7 - commandWidth);
        os << row << std::endl;
    }
}

int
runFuzz(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;
    std::string target;
    std::optional<uint64_t> iterations;
    std::optional<uint64_t> initialSeed;

    return runWithHelp(args,
                       {configurationParser(configOption), targetParser(target),
                        iterationsParser(iterations),
                        initialSeedParser(initialSeed)},
                       [&] {
                           auto cfg = configOption.getConfig();
                           auto n = iterations.value_or(cfg.DEFAULT_ITERATIONS);
                           auto report =
                               runFuzzSession(cfg, target, n, initialSeed);
                           std::cout << fmt::format(
                               FMT_STRING("{} iterations, {} failures, "
                                          "estimate {:.1f} -> {:.1f}"),
                               report.mIterations, report.mFailures,
                               report.mStartCount, report.mEndCount)
                                     << std::endl;
                           return 0;
                       });
}

int
runVerify(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;
    std::string target;

    return runWithHelp(
        args, {configurationParser(configOption), targetParser(target)}, [&] {
            auto cfg = configOption.getConfig();
            auto n = runVerifySession(cfg, target);
            std::cout << fmt::format(FMT_STRING("{} results verified"), n)
                      << std::endl;
            return 0;
        });
}

int
runMerge(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;
    std::string target;
    std::string snapshotFile;

    return runWithHelp(args,
                       {configurationParser(configOption), targetParser(target),
                        requiredArgParser(snapshotFile, "SNAPSHOT-FILE")},
                       [&] {
                           auto cfg = configOption.getConfig();
                           auto n = runMergeSession(cfg, target, snapshotFile);
                           std::cout
                               << fmt::format(
                                      FMT_STRING("{} results after merge"), n)
                               << std::endl;
                           return 0;
                       });
}

int
runInfo(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;
    std::string target;

    return runWithHelp(
        args, {configurationParser(configOption), targetParser(target)}, [&] {
            auto cfg = configOption.getConfig();
            auto s = describeSnapshot(cfg, target);
            if (!s.mExists)
            {
                std::cout << "no snapshot at " << s.mPath << std::endl;
                return 0;
            }
            std::cout << "snapshot:  " << s.mPath << std::endl
                      << "precision: " << s.mPrecision << std::endl
                      << "registers: " << s.mNonZeroRegisters << "/"
                      << s.mRegisters << " set" << std::endl
                      << "history:   " << s.mHistoryLength << std::endl
                      << fmt::format(FMT_STRING("estimate:  {:.1f}"),
                                     s.mEstimate)
                      << std::endl;
            return 0;
        });
}

int
runVersion(CommandLineArgs const&)
{
    std::cout << POTFUZZ_VERSION << std::endl;
    return 0;
}
}

int
handleCommandLine(int argc, char* const* argv)
{
    auto commandLine = CommandLine{
        {{"test",
          "fuzz a target with random seeds and record distinct outputs",
          runFuzz},
         {"verify", "replay recorded seeds and check outputs are unchanged",
          runVerify},
         {"merge", "merge another snapshot into the target's snapshot",
          runMerge},
         {"info", "print a summary of the target's snapshot", runInfo},
         {"version", "print version information", runVersion}}};

    auto adjustedCommandLine = commandLine.adjustCommandLine({argc, argv});
    auto command = commandLine.selectCommand(adjustedCommandLine.first);
    bool didDefaultToHelp = command->name() != adjustedCommandLine.first;

    auto exeName = "potfuzz";
    auto commandName =
        fmt::format(FMT_STRING("{0} {1}"), exeName, command->name());
    auto args = CommandLineArgs{exeName, commandName, command->description(),
                                adjustedCommandLine.second};

    try
    {
        int res = command->run(args);
        return didDefaultToHelp ? 1 : res;
    }
    catch (std::exception& e)
    {
        LOG_FATAL(DEFAULT_LOG, "Got an exception: {}", e.what());
        return 1;
    }
}
}
