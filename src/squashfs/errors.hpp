#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include "helpers.hpp"

// Every failure raised by the engine derives from SquashfsError so callers
// can catch the whole family in one place.
class SquashfsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IoError : public SquashfsError {
public:
    using SquashfsError::SquashfsError;
};

class NotAnImage : public SquashfsError {
public:
    using SquashfsError::SquashfsError;
};

class CorruptSuperblock : public SquashfsError {
public:
    using SquashfsError::SquashfsError;
};

class UnsupportedVersion : public SquashfsError {
public:
    UnsupportedVersion(uint16_t major, uint16_t minor)
        : SquashfsError("unsupported SquashFS version " + std::to_string(major) + "." +
                        std::to_string(minor) + " (only 4.x is handled)"),
          versionMajor(major), versionMinor(minor) {}

    uint16_t major() const { return versionMajor; }
    uint16_t minor() const { return versionMinor; }

private:
    uint16_t versionMajor;
    uint16_t versionMinor;
};

// Raised by session operations that need a superblock on a forced session.
class NoSuperblock : public SquashfsError {
public:
    NoSuperblock() : SquashfsError("image has no valid superblock (opened in force mode)") {}
};

class UnsupportedCodec : public SquashfsError {
public:
    explicit UnsupportedCodec(uint16_t id)
        : SquashfsError("unsupported compression id " + std::to_string(id)), id(id) {}

    uint16_t codecId() const { return id; }

private:
    uint16_t id;
};

// Thrown by codecs themselves; callers turn it into CorruptBlock with the
// offset of the block being decoded.
class DecompressError : public SquashfsError {
public:
    using SquashfsError::SquashfsError;
};

class CorruptBlock : public SquashfsError {
public:
    CorruptBlock(uint64_t offset, const std::string& what)
        : SquashfsError("corrupt block at 0x" + to_hex(offset) + ": " + what), at(offset) {}

    uint64_t offset() const { return at; }

private:
    uint64_t at;
};

class TruncatedImage : public SquashfsError {
public:
    TruncatedImage(uint64_t offset, uint64_t length)
        : SquashfsError("image truncated: cannot read " + std::to_string(length) +
                        " bytes at 0x" + to_hex(offset)),
          at(offset) {}

    uint64_t offset() const { return at; }

private:
    uint64_t at;
};

class TruncatedFile : public SquashfsError {
public:
    TruncatedFile(uint64_t expected, uint64_t actual)
        : SquashfsError("file content truncated: expected " + std::to_string(expected) +
                        " bytes, reconstructed " + std::to_string(actual)),
          expectedSize(expected), actualSize(actual) {}

    uint64_t expected() const { return expectedSize; }
    uint64_t actual() const { return actualSize; }

private:
    uint64_t expectedSize;
    uint64_t actualSize;
};

class UnknownInodeType : public SquashfsError {
public:
    explicit UnknownInodeType(uint16_t tag)
        : SquashfsError("unknown inode type " + std::to_string(tag)), value(tag) {}

    uint16_t tag() const { return value; }

private:
    uint16_t value;
};

class NotFound : public SquashfsError {
public:
    explicit NotFound(const std::string& component)
        : SquashfsError("no such file or directory: " + component), name(component) {}

    const std::string& component() const { return name; }

private:
    std::string name;
};

class NotADirectory : public SquashfsError {
public:
    explicit NotADirectory(const std::string& component)
        : SquashfsError("not a directory: " + component), name(component) {}

    const std::string& component() const { return name; }

private:
    std::string name;
};

class NotAFile : public SquashfsError {
public:
    explicit NotAFile(const std::string& what)
        : SquashfsError("not a regular file: " + what) {}
};

class NotASymlink : public SquashfsError {
public:
    explicit NotASymlink(const std::string& what)
        : SquashfsError("not a symbolic link: " + what) {}
};
