#include "path_resolver.hpp"
#include "errors.hpp"

PathResolver::PathResolver(const InodeDecoder& decoder, const DirectoryReader& reader, InodeRef root)
    : decoder(decoder), reader(reader), root(root) {}

std::vector<std::string> PathResolver::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) {
            parts.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return parts;
}

Inode PathResolver::resolve(const std::string& path) const {
    std::vector<Inode> chain;
    chain.push_back(decoder.decode(root));

    std::string walked;
    for (const auto& component : splitPath(path)) {
        if (component == ".") {
            continue;
        }
        if (component == "..") {
            if (chain.size() > 1) chain.pop_back();
            walked += "/..";
            continue;
        }
        walked += "/" + component;

        const Inode& current = chain.back();
        if (!current.isDirectory()) {
            throw NotADirectory(walked.substr(0, walked.size() - component.size() - 1));
        }
        auto entry = reader.find(current, component);
        if (!entry) {
            throw NotFound(walked);
        }
        chain.push_back(decoder.decode(entry->ref));
    }
    return chain.back();
}
