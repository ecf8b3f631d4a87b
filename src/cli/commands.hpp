#pragma once
#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include "session.hpp"

struct CommandSpec;

// What a command can see and change while it runs.
struct ShellState {
    const Session& session;
    std::ostream& out;
    const std::vector<CommandSpec>& commands;
    std::string cwd = "/";
    bool running = true;
};

using CommandHandler = std::function<void(ShellState&, const std::vector<std::string>&)>;

struct CommandSpec {
    std::string name;
    std::string usage;
    std::string help;
    CommandHandler handler;
};

// Every explorer command, in the order `help` lists them.
const std::vector<CommandSpec>& commandTable();

// Absolute, normalised form of `path` taken relative to `cwd`.
std::string joinPath(const std::string& cwd, const std::string& path);
