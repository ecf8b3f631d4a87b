#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "session.hpp"

// Line-oriented explorer over an opened session. A failing command is
// reported and the shell carries on.
class Shell {
public:
    Shell(const Session& session, const std::vector<CommandSpec>& commands, std::ostream& out);

    // Runs one command line. Returns false when the command failed or was
    // not recognised.
    bool execute(const std::string& line);

    // Reads commands until end of input or exit/quit.
    void run(std::istream& in, bool interactive);

    bool running() const { return state.running; }
    const std::string& cwd() const { return state.cwd; }

private:
    const CommandSpec* find(const std::string& name) const;

    ShellState state;
};
