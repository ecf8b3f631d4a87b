#include "session.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>

Session::Session(std::unique_ptr<ImageFile> image, std::shared_ptr<const CodecRegistry> registry)
    : image(std::move(image)), registry(std::move(registry)) {}

std::unique_ptr<Session> Session::open(const fs::path& path, const SessionOptions& options) {
    auto image = std::make_unique<ImageFile>(path);
    auto codecs = options.codecs ? options.codecs : CodecRegistry::withDefaults();
    std::unique_ptr<Session> session(new Session(std::move(image), std::move(codecs)));

    try {
        session->sb = parseSuperblock(session->image->readUpTo(0, SUPERBLOCK_SIZE));
    } catch (const NotAnImage& e) {
        session->rejectSuperblock(e, options.force);
        return session;
    } catch (const UnsupportedVersion& e) {
        session->rejectSuperblock(e, options.force);
        return session;
    } catch (const CorruptSuperblock& e) {
        session->rejectSuperblock(e, options.force);
        return session;
    }

    const Superblock& super = *session->sb;
    if (super.bytesUsed > session->image->size()) {
        Logger::warn("image is " + std::to_string(session->image->size()) + " bytes but the superblock claims " +
                     std::to_string(super.bytesUsed) + "; reads past the end will fail");
    }
    if (!session->registry->supports(super.compressionId)) {
        Logger::debug("no codec registered for " + compressionName(super.compressionId) +
                      "; compressed blocks will be rejected");
    }

    session->store = std::make_unique<MetadataBlockStore>(*session->image, *session->registry,
                                                          super.compressionId, options.cacheBlocks);
    session->decoder = std::make_unique<InodeDecoder>(*session->store, super);
    session->directories = std::make_unique<DirectoryReader>(*session->store, super);
    session->resolver = std::make_unique<PathResolver>(*session->decoder, *session->directories,
                                                       super.rootInodeRef);
    session->files = std::make_unique<FileContentReader>(*session->image, *session->registry,
                                                         super, session->fragments);

    Logger::debug("opened " + path.string() + ": " + compressionName(super.compressionId) +
                  ", block size " + std::to_string(super.blockSize) +
                  ", " + std::to_string(super.inodeCount) + " inodes, cache " +
                  std::to_string(options.cacheBlocks) + " blocks");
    return session;
}

// Called from a catch handler: rethrows unless force mode was requested.
void Session::rejectSuperblock(const SquashfsError& error, bool force) {
    if (!force) {
        throw;
    }
    rejection = error.what();
    Logger::warn("no valid superblock (" + rejection + "); continuing in limited mode");
}

void Session::requireSuperblock() const {
    if (!sb) {
        throw NoSuperblock();
    }
}

void Session::loadTables() const {
    requireSuperblock();
    std::lock_guard<std::mutex> lock(tablesMutex);
    if (tablesLoaded) {
        return;
    }
    ids = IdTable::load(*image, *store, *sb);
    fragments = FragmentTable::load(*image, *store, *sb);
    tablesLoaded = true;
    Logger::debug("loaded " + std::to_string(ids.size()) + " ids and " +
                  std::to_string(fragments.size()) + " fragment entries");
}

Inode Session::withOwner(Inode inode) const {
    inode.uid = ids.lookup(inode.uidIdx);
    inode.gid = ids.lookup(inode.gidIdx);
    return inode;
}

Inode Session::root() const {
    requireSuperblock();
    return inodeAt(sb->rootInodeRef);
}

Inode Session::inodeAt(InodeRef ref) const {
    loadTables();
    return withOwner(decoder->decode(ref));
}

Inode Session::resolve(const std::string& path) const {
    loadTables();
    return withOwner(resolver->resolve(path));
}

std::vector<DirEntry> Session::list(const Inode& dir) const {
    requireSuperblock();
    return directories->entries(dir);
}

void Session::walk(const Inode& dir, const std::string& base, const WalkVisitor& visit) const {
    requireSuperblock();
    if (!dir.isDirectory()) {
        throw NotADirectory(base);
    }
    std::string prefix = base;
    if (prefix.empty() || prefix.back() != '/') {
        prefix += '/';
    }
    std::vector<InodeRef> chain{dir.ref};
    walkFrom(dir, prefix, chain, visit);
}

bool Session::walkFrom(const Inode& dir, const std::string& prefix, std::vector<InodeRef>& chain,
                       const WalkVisitor& visit) const {
    bool keepGoing = true;
    directories->forEach(dir, [&](const DirEntry& entry) {
        bool isDir = entry.type == InodeType::Directory;
        std::string path = prefix + entry.name + (isDir ? "/" : "");
        if (!visit(path, entry)) {
            keepGoing = false;
            return false;
        }
        if (!isDir) {
            return true;
        }
        if (std::find(chain.begin(), chain.end(), entry.ref) != chain.end()) {
            throw CorruptBlock(sb->directoryTableStart, "directory " + path + " contains itself");
        }
        chain.push_back(entry.ref);
        keepGoing = walkFrom(decoder->decode(entry.ref), path, chain, visit);
        chain.pop_back();
        return keepGoing;
    });
    return keepGoing;
}

std::vector<uint8_t> Session::readFile(const Inode& file) const {
    loadTables();
    return files->read(file);
}

std::vector<uint8_t> Session::readSymlink(const Inode& inode) const {
    if (!inode.isSymlink()) {
        throw NotASymlink("inode " + std::to_string(inode.inodeNumber) + " is a " + inode.typeName());
    }
    return inode.symlinkTarget;
}

std::vector<uint8_t> Session::readBlock(const Inode& file, size_t index) const {
    loadTables();
    return files->readBlock(file, index);
}

std::vector<uint8_t> Session::rawHeaderBytes(size_t n) const {
    return image->readUpTo(0, n);
}

const IdTable& Session::idTable() const {
    loadTables();
    return ids;
}

const FragmentTable& Session::fragmentTable() const {
    loadTables();
    return fragments;
}

MetadataStats Session::metadataStats() const {
    MetadataStats stats;
    if (store) {
        stats.hits = store->hits();
        stats.misses = store->misses();
        stats.cached = store->cached();
        stats.capacity = store->capacity();
    }
    return stats;
}
