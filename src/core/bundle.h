#pragma once

#include "errors.h"

#include <string>
#include <vector>

namespace gang::core {

enum class ArchiveFormat { Zip, Tar };

struct ArchiveEntry {
    std::string name;
    std::string data;
};

bool parse_archive_format(const std::string& value, ArchiveFormat& out);
const char* archive_extension(ArchiveFormat format);

// Builds the whole archive in memory.
bool write_archive(const std::vector<ArchiveEntry>& entries,
                   ArchiveFormat format,
                   std::vector<char>& out,
                   Error& error);

} // namespace gang::core
