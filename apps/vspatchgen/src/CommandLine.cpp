#include "CommandLine.hpp"

#include <charconv>

#include <fmt/format.h>

#include "vpg/core/Error.hpp"

namespace vpg::app {

namespace {

std::size_t ExpectedPositionals(Command command) {
    switch (command) {
        case Command::File:    return 2;
        case Command::Folder:  return 3;
        case Command::FileId:  return 1;
        case Command::Inspect: return 1;
        case Command::Help:    return 0;
    }
    return 0;
}

std::optional<Command> ParseCommand(const std::string& text) {
    if (text == "file") return Command::File;
    if (text == "folder") return Command::Folder;
    if (text == "fileid") return Command::FileId;
    if (text == "inspect") return Command::Inspect;
    if (text == "help" || text == "--help" || text == "-h") return Command::Help;
    return std::nullopt;
}

int ParseThreshold(const std::string& text) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 1) {
        throw core::ConfigError("--collapse", fmt::format("'{}' is not a positive integer", text));
    }
    return value;
}

} // namespace

CommandLineOptions ParseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;
    if (args.empty()) {
        return options;
    }

    const auto command = ParseCommand(args.front());
    if (!command) {
        throw core::ConfigError("command", fmt::format("unknown command '{}'", args.front()));
    }
    options.command = *command;
    if (options.command == Command::Help) {
        return options;
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw core::ConfigError(arg, "missing value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.command = Command::Help;
            return options;
        } else if (arg == "--config") {
            options.configPath = next();
        } else if (arg == "-o" || arg == "--out") {
            options.outputFile = next();
        } else if (arg == "--log-file") {
            options.logFile = next();
        } else if (arg == "--side") {
            const std::string& value = next();
            options.side = utils::ParseSide(value);
            if (!options.side) {
                throw core::ConfigError(arg, fmt::format("expected server, client or both, got '{}'", value));
            }
        } else if (arg == "--array") {
            const std::string& value = next();
            options.arrayMode = utils::ParseArrayMode(value);
            if (!options.arrayMode) {
                throw core::ConfigError(arg, fmt::format("expected replace or index, got '{}'", value));
            }
        } else if (arg == "--collapse") {
            options.collapseThreshold = ParseThreshold(next());
        } else if (arg == "--add") {
            options.preferAddMerge = false;
        } else if (arg == "--addmerge") {
            options.preferAddMerge = true;
        } else if (arg == "--no-escape") {
            options.escapePathSegments = false;
        } else if (arg == "--auto-depends") {
            options.autoDepends = true;
        } else if (arg == "--vanilla") {
            options.vanillaFiles = true;
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg.size() > 1 && arg.front() == '-') {
            throw core::ConfigError(arg, "unknown option");
        } else {
            options.positional.push_back(arg);
        }
    }

    const std::size_t expected = ExpectedPositionals(options.command);
    if (options.positional.size() != expected) {
        throw core::ConfigError(args.front(),
                                fmt::format("expected {} path argument(s), got {}", expected,
                                            options.positional.size()));
    }
    if (options.outputFile && options.command != Command::File) {
        throw core::ConfigError("--out", "only valid with the file command");
    }
    return options;
}

void ApplyOverrides(const CommandLineOptions& options, utils::ToolConfig& config) {
    if (options.arrayMode) {
        config.diff.arrayMode = *options.arrayMode;
    }
    if (options.side) {
        config.diff.side = *options.side;
    }
    if (options.preferAddMerge) {
        config.diff.preferAddMerge = *options.preferAddMerge;
    }
    if (options.escapePathSegments) {
        config.diff.escapePathSegments = *options.escapePathSegments;
    }
    if (options.collapseThreshold) {
        config.diff.collapseThreshold = *options.collapseThreshold;
    }
    if (options.autoDepends) {
        config.batch.autoDepends = true;
    }
    if (options.vanillaFiles) {
        config.batch.vanillaFiles = true;
    }
    if (options.logFile) {
        config.logging.file = *options.logFile;
    }
    if (options.verbose) {
        config.logging.debug = true;
    }
}

std::string UsageText() {
    return
        "Usage:\n"
        "  vspatchgen file <source.json> <edited.json> [-o <out.json>] [options]\n"
        "  vspatchgen folder <sourceRoot> <editedRoot> <outRoot> [options]\n"
        "  vspatchgen fileid <path> [--vanilla]\n"
        "  vspatchgen inspect <patch.json>\n"
        "\n"
        "Options:\n"
        "  --config <file>        JSON config file (diff, batch and logging sections)\n"
        "  --side <side>          server (default), client or both\n"
        "  --array <mode>         replace: rewrite changed arrays whole (default)\n"
        "                         index: diff arrays index by index\n"
        "  --add                  write add instead of addmerge\n"
        "  --collapse <n>         collapse to one root replace above n ops (default 800)\n"
        "  --no-escape            do not escape '~' and '/' in object keys\n"
        "  --auto-depends         add a dependsOn entry for non-vanilla domains\n"
        "  --vanilla              treat creative/survival assets as the game domain\n"
        "  --log-file <file>      append log lines to a file\n"
        "  -q, --quiet            only log warnings and errors\n"
        "  -v, --verbose          enable debug logging\n"
        "  -h, --help             show this text\n";
}

} // namespace vpg::app
