#include "json_dump.hpp"
#include "helpers.hpp"
#include "cJSON.h"
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

void addOffset(cJSON* obj, const char* key, uint64_t start) {
    if (start == INVALID_TABLE) {
        cJSON_AddNullToObject(obj, key);
    } else {
        cJSON_AddStringToObject(obj, key, ("0x" + to_hex(start)).c_str());
    }
}

cJSON* build_json_superblock(const Superblock& sb, uint64_t imageSize) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "magic", ("0x" + to_hex(sb.magic)).c_str());
    cJSON_AddStringToObject(item, "version",
                            (std::to_string(sb.versionMajor) + "." + std::to_string(sb.versionMinor)).c_str());
    cJSON_AddNumberToObject(item, "inode_count", sb.inodeCount);
    cJSON_AddNumberToObject(item, "modification_time", sb.modificationTime);
    cJSON_AddStringToObject(item, "modification_date", format_timestamp(sb.modificationTime).c_str());
    cJSON_AddNumberToObject(item, "block_size", sb.blockSize);
    cJSON_AddNumberToObject(item, "block_log", sb.blockLog);
    cJSON_AddNumberToObject(item, "fragment_entry_count", sb.fragmentEntryCount);
    cJSON_AddNumberToObject(item, "compression_id", sb.compressionId);
    cJSON_AddStringToObject(item, "compression", compressionName(sb.compressionId).c_str());
    cJSON_AddNumberToObject(item, "id_count", sb.idCount);
    cJSON_AddStringToObject(item, "root_inode", ("0x" + to_hex(sb.rootInodeRef.raw)).c_str());
    cJSON_AddNumberToObject(item, "bytes_used", static_cast<double>(sb.bytesUsed));
    cJSON_AddNumberToObject(item, "image_size", static_cast<double>(imageSize));

    cJSON* flags = cJSON_CreateArray();
    for (const auto& flag : flagNames(sb.flags)) {
        cJSON_AddItemToArray(flags, cJSON_CreateString(flag.second.c_str()));
    }
    cJSON_AddItemToObject(item, "flags", flags);

    cJSON* tables = cJSON_CreateObject();
    addOffset(tables, "inode", sb.inodeTableStart);
    addOffset(tables, "directory", sb.directoryTableStart);
    addOffset(tables, "fragment", sb.fragmentTableStart);
    addOffset(tables, "export", sb.exportTableStart);
    addOffset(tables, "id", sb.idTableStart);
    addOffset(tables, "xattr_id", sb.xattrIdTableStart);
    cJSON_AddItemToObject(item, "tables", tables);
    return item;
}

}

bool dumpSuperblockJson(const Superblock& sb, uint64_t imageSize, const std::string& filename) {
    std::ofstream outFile(fs::path(filename), std::ios::binary);
    if (!outFile.is_open()) {
        return false;
    }
    cJSON* root = build_json_superblock(sb, imageSize);
    char* jsonStr = cJSON_Print(root);
    outFile.write(jsonStr, static_cast<std::streamsize>(strlen(jsonStr)));
    outFile << "\n";
    cJSON_Delete(root);
    free(jsonStr);
    return static_cast<bool>(outFile);
}
