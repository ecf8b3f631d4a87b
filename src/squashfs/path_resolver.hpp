#pragma once
#include <string>
#include <vector>
#include "directory.hpp"
#include "inode.hpp"

class PathResolver {
public:
    PathResolver(const InodeDecoder& decoder, const DirectoryReader& reader, InodeRef root);

    // Walks `path` from the root inode. Empty components are ignored, "."
    // stays put and ".." steps back along the walked chain (the root is its
    // own parent). Names compare byte for byte.
    Inode resolve(const std::string& path) const;

    static std::vector<std::string> splitPath(const std::string& path);

private:
    const InodeDecoder& decoder;
    const DirectoryReader& reader;
    InodeRef root;
};
