#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <unistd.h>
#include "logger.hpp"
#include "errors.hpp"
#include "session.hpp"
#include "shell.hpp"
#include "utils/json_dump.hpp"

namespace fs = std::filesystem;
struct Config {
    bool force = false;
    size_t cacheBlocks = MetadataBlockStore::DEFAULT_CAPACITY;
    std::vector<std::string> commands;  // -x, run in order instead of the prompt
    bool jsonOutput = false;
    std::string jsonFile;
    std::string inputFile;
};


class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::vector<std::string>> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    void parse(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (optionDefs.count(arg)) {
                const auto& info = optionDefs[arg];

                if (info.takesValue) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Missing value for option: " + arg);
                    }
                    parsedOptions[info.canonicalName].push_back(argv[++i]);
                } else {
                    parsedOptions[info.canonicalName].push_back("true");
                }
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else {
                positional.push_back(arg);
            }
        }
    }

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical);
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second.back() : def;
    }

    std::vector<std::string> all(const std::string& canonical) const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : std::vector<std::string>{};
    }
};


static void usage() {
    std::cout << "Usage: squashdig [-f] [-d] [-c N] [-x CMD]... [-O file] <image>\n"
              << "  -f         Continue without a valid superblock\n"
              << "  -d         Enable Debug mode\n"
              << "  -c N       Metadata cache size in blocks (default 32, 0 disables)\n"
              << "  -x CMD     Run CMD instead of the interactive prompt (repeatable)\n"
              << "  -O [file]  Write the superblock as JSON to the given file\n"
              << "  -h         Show this help message\n";
}

Config parseArgs(int argc, char* argv[]) {

    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-f", false, "force");
    args.addOption("--force", false, "force");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-c", true, "cache");
    args.addOption("--cache", true, "cache");

    args.addOption("-x", true, "exec");
    args.addOption("--exec", true, "exec");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.parse(argc, argv);

    if (args.has("help") || args.positional.empty()) {
        usage();
        std::exit(args.has("help") ? 0 : 1);
    }

    if (args.has("debug")) {
        Logger::setLevel(LogLevel::DEBUG);
        Logger::debug("Enabling Debug Mode");
    }

    if (args.has("force")) {
        Logger::debug("Force mode: a bad superblock will not stop the explorer");
        config.force = true;
    }

    if (args.has("cache")) {
        std::string value = args.get("cache");
        size_t used = 0;
        long blocks = std::stol(value, &used);
        if (used != value.size() || blocks < 0) {
            throw std::runtime_error("Invalid cache size: " + value);
        }
        config.cacheBlocks = static_cast<size_t>(blocks);
        Logger::debug("Setting metadata cache to " + std::to_string(config.cacheBlocks) + " blocks");
    }

    config.commands = args.all("exec");

    if (args.has("jsonPath")) {
        config.jsonFile = args.get("jsonPath");
        config.jsonOutput = true;
        Logger::debug("Setting json output path to " + config.jsonFile);
    }

    config.inputFile = args.positional.back();

    return config;
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);
    Logger::setColour(isatty(STDERR_FILENO) != 0);

    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        usage();
        return 1;
    }

    SessionOptions options;
    options.force = config.force;
    options.cacheBlocks = config.cacheBlocks;

    std::unique_ptr<Session> session;
    try {
        session = Session::open(fs::path(config.inputFile), options);
    } catch (const SquashfsError& e) {
        Logger::error(config.inputFile + ": " + e.what());
        if (!config.force) {
            Logger::info("Use -f to explore the image anyway");
        }
        return 1;
    }
    Logger::info("Opened " + config.inputFile);

    if (config.jsonOutput) {
        if (!session->superblock()) {
            Logger::error("No superblock to write to " + config.jsonFile);
        } else if (!dumpSuperblockJson(*session->superblock(), session->imageSize(), config.jsonFile)) {
            Logger::error("Could not write " + config.jsonFile);
            return 1;
        }
    }

    Shell shell(*session, commandTable(), std::cout);
    if (!config.commands.empty()) {
        bool ok = true;
        for (const auto& line : config.commands) {
            ok = shell.execute(line) && ok;
            if (!shell.running()) break;
        }
        return ok ? 0 : 1;
    }

    if (isatty(STDIN_FILENO)) {
        std::cout << "SquashFS explorer: " << config.inputFile << "\n"
                  << "Type 'help' for a list of commands.\n";
    }
    shell.run(std::cin, isatty(STDIN_FILENO) != 0);

    auto stats = session->metadataStats();
    Logger::debug("metadata cache: " + std::to_string(stats.hits) + " hits, " +
                  std::to_string(stats.misses) + " misses");
    return 0;
}
