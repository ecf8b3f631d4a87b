#include "shell.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

Shell::Shell(const Session& session, const std::vector<CommandSpec>& commands, std::ostream& out)
    : state{session, out, commands} {}

const CommandSpec* Shell::find(const std::string& name) const {
    for (const auto& cmd : state.commands) {
        if (cmd.name == name) return &cmd;
    }
    return nullptr;
}

bool Shell::execute(const std::string& line) {
    std::istringstream tokens(line);
    std::string name;
    if (!(tokens >> name)) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<std::string> args;
    std::string arg;
    while (tokens >> arg) {
        args.push_back(arg);
    }

    const CommandSpec* cmd = find(name);
    if (!cmd) {
        Logger::error("Unknown command: " + name + " (type 'help' for a list of commands)");
        return false;
    }

    Logger::debug("running " + name + " with " + std::to_string(args.size()) + " argument(s)");
    try {
        cmd->handler(state, args);
    } catch (const std::exception& e) {
        Logger::error(name + ": " + e.what());
        return false;
    }
    return true;
}

void Shell::run(std::istream& in, bool interactive) {
    std::string line;
    while (state.running) {
        if (interactive) {
            state.out << ansi::bold << ansi::green << "squashfs:" << state.cwd << "> " << ansi::reset << std::flush;
        }
        if (!std::getline(in, line)) {
            break;
        }
        execute(line);
    }
}
