#include "commands.hpp"
#include "errors.hpp"
#include "printer.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <stdexcept>

namespace {

constexpr size_t DEFAULT_DUMP_BYTES = 64;
constexpr size_t MAX_DUMP_BYTES = 1 << 20;
constexpr size_t CAT_HEX_LIMIT = 256;

const Superblock& requireSuperblock(const ShellState& state) {
    if (!state.session.superblock()) {
        throw NoSuperblock();
    }
    return *state.session.superblock();
}

// Byte count argument; anything that is not a plain number keeps the default.
size_t dumpCount(const std::vector<std::string>& args) {
    if (args.empty() || args[0].empty() ||
        !std::all_of(args[0].begin(), args[0].end(), [](unsigned char c) { return std::isdigit(c); })) {
        return DEFAULT_DUMP_BYTES;
    }
    size_t count = 0;
    for (char c : args[0]) {
        count = count * 10 + static_cast<size_t>(c - '0');
        if (count > MAX_DUMP_BYTES) return MAX_DUMP_BYTES;
    }
    return count;
}

const std::string& requireArg(const std::vector<std::string>& args, const std::string& usage) {
    if (args.empty()) {
        throw std::invalid_argument("usage: " + usage);
    }
    return args[0];
}

void cmdHelp(ShellState& state, const std::vector<std::string>&) {
    size_t width = 0;
    for (const auto& cmd : state.commands) {
        width = std::max(width, cmd.usage.size());
    }
    state.out << "Available commands:\n";
    for (const auto& cmd : state.commands) {
        state.out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << cmd.usage
                  << "- " << cmd.help << "\n";
    }
}

void cmdInfo(ShellState& state, const std::vector<std::string>&) {
    printSuperblock(state.out, requireSuperblock(state), state.session.imageSize());
}

void cmdMagic(ShellState& state, const std::vector<std::string>&) {
    printMagic(state.out, state.session.rawHeaderBytes(4));
}

void cmdHex(ShellState& state, const std::vector<std::string>& args) {
    auto bytes = state.session.rawHeaderBytes(dumpCount(args));
    state.out << "Hex dump of first " << bytes.size() << " bytes:\n";
    printHexDump(state.out, bytes);
}

void cmdRaw(ShellState& state, const std::vector<std::string>& args) {
    auto bytes = state.session.rawHeaderBytes(dumpCount(args));
    state.out << "Raw bytes of first " << bytes.size() << " bytes:\n";
    printRawBytes(state.out, bytes);
}

void cmdVersion(ShellState& state, const std::vector<std::string>&) {
    printVersion(state.out, requireSuperblock(state));
}

void cmdDate(ShellState& state, const std::vector<std::string>&) {
    printDate(state.out, requireSuperblock(state));
}

void cmdCompression(ShellState& state, const std::vector<std::string>&) {
    const Superblock& sb = requireSuperblock(state);
    printCompression(state.out, sb);
    if (!state.session.codecs().supports(sb.compressionId)) {
        state.out << "No decompressor available for this image\n";
    }
}

void cmdBlock(ShellState& state, const std::vector<std::string>&) {
    printBlockSize(state.out, requireSuperblock(state));
}

void cmdFlags(ShellState& state, const std::vector<std::string>&) {
    printFlags(state.out, requireSuperblock(state));
}

void cmdOffsets(ShellState& state, const std::vector<std::string>&) {
    printOffsets(state.out, requireSuperblock(state));
}

void cmdSize(ShellState& state, const std::vector<std::string>&) {
    printSize(state.out, requireSuperblock(state), state.session.imageSize());
}

void cmdLs(ShellState& state, const std::vector<std::string>& args) {
    std::string path = joinPath(state.cwd, args.empty() ? "." : args[0]);
    Inode dir = state.session.resolve(path);
    if (!dir.isDirectory()) {
        throw NotADirectory(path);
    }
    std::vector<ListingRow> rows;
    for (const auto& entry : state.session.list(dir)) {
        rows.push_back({entry, state.session.inodeAt(entry.ref)});
    }
    printListing(state.out, rows);
}

// Every path below a directory, one per line.
void cmdFind(ShellState& state, const std::vector<std::string>& args) {
    std::string path = joinPath(state.cwd, args.empty() ? "." : args[0]);
    Inode start = state.session.resolve(path);
    if (!start.isDirectory()) {
        state.out << path << "\n";
        return;
    }
    state.session.walk(start, path, [&state](const std::string& found, const DirEntry&) {
        state.out << found << "\n";
        return true;
    });
}

void cmdCd(ShellState& state, const std::vector<std::string>& args) {
    std::string path = joinPath(state.cwd, args.empty() ? "/" : args[0]);
    Inode dir = state.session.resolve(path);
    if (!dir.isDirectory()) {
        throw NotADirectory(path);
    }
    state.cwd = path;
}

void cmdPwd(ShellState& state, const std::vector<std::string>&) {
    state.out << state.cwd << "\n";
}

void cmdCat(ShellState& state, const std::vector<std::string>& args) {
    std::string path = joinPath(state.cwd, requireArg(args, "cat <file>"));
    auto content = state.session.readFile(state.session.resolve(path));
    if (isPrintableText(content)) {
        state.out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        if (!content.empty() && content.back() != '\n') {
            state.out << "\n";
        }
        return;
    }
    state.out << "Binary file: " << path << " (showing hex dump)\n";
    std::vector<uint8_t> head(content.begin(), content.begin() + std::min(content.size(), CAT_HEX_LIMIT));
    printHexDump(state.out, head);
    if (content.size() > CAT_HEX_LIMIT) {
        state.out << "... truncated, total size: " << content.size() << " bytes\n";
    }
}

void cmdStat(ShellState& state, const std::vector<std::string>& args) {
    std::string path = joinPath(state.cwd, args.empty() ? "." : args[0]);
    printInode(state.out, state.session.resolve(path));
}

void cmdReadlink(ShellState& state, const std::vector<std::string>& args) {
    std::string path = joinPath(state.cwd, requireArg(args, "readlink <link>"));
    auto target = state.session.readSymlink(state.session.resolve(path));
    state.out << std::string(target.begin(), target.end()) << "\n";
}

void cmdIds(ShellState& state, const std::vector<std::string>&) {
    printIdTable(state.out, state.session.idTable());
}

void cmdFragments(ShellState& state, const std::vector<std::string>&) {
    printFragmentTable(state.out, state.session.fragmentTable());
}

void cmdExit(ShellState& state, const std::vector<std::string>&) {
    state.running = false;
}

}

const std::vector<CommandSpec>& commandTable() {
    static const std::vector<CommandSpec> table = {
        {"help",        "help",             "Show this help message", cmdHelp},
        {"info",        "info",             "Show every superblock field", cmdInfo},
        {"magic",       "magic",            "Check the magic number", cmdMagic},
        {"hex",         "hex [n]",          "Hex dump of the first n bytes (default 64)", cmdHex},
        {"raw",         "raw [n]",          "First n bytes as decimal values (default 64)", cmdRaw},
        {"version",     "version",          "Show the format version", cmdVersion},
        {"date",        "date",             "Show the modification time", cmdDate},
        {"compression", "compression",      "Show the compression algorithm", cmdCompression},
        {"block",       "block",            "Show the data block size", cmdBlock},
        {"flags",       "flags",            "Decode the superblock flags", cmdFlags},
        {"offsets",     "offsets",          "Show the table offsets", cmdOffsets},
        {"size",        "size",             "Show bytes used and the image size", cmdSize},
        {"ls",          "ls [path]",        "List a directory", cmdLs},
        {"find",        "find [path]",      "List every path below a directory", cmdFind},
        {"cd",          "cd [path]",        "Change the current directory", cmdCd},
        {"pwd",         "pwd",              "Show the current directory", cmdPwd},
        {"cat",         "cat <file>",       "Show file contents (hex dump for binary data)", cmdCat},
        {"stat",        "stat [path]",      "Show the decoded inode", cmdStat},
        {"readlink",    "readlink <link>",  "Show a symbolic link target", cmdReadlink},
        {"ids",         "ids",              "Show the uid/gid table", cmdIds},
        {"fragments",   "fragments",        "Show the fragment table", cmdFragments},
        {"exit",        "exit",             "Leave the explorer", cmdExit},
        {"quit",        "quit",             "Leave the explorer", cmdExit},
    };
    return table;
}

std::string joinPath(const std::string& cwd, const std::string& path) {
    std::string combined = (!path.empty() && path[0] == '/') ? path : cwd + "/" + path;
    std::vector<std::string> parts;
    for (const auto& component : PathResolver::splitPath(combined)) {
        if (component == ".") continue;
        if (component == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(component);
    }
    std::string result;
    for (const auto& part : parts) {
        result += "/" + part;
    }
    return result.empty() ? "/" : result;
}
