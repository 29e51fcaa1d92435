#pragma once

#include <cstdint>
#include <string>

#include "usagedb/core/result.h"

namespace usagedb {
namespace storage {

/**
 * @brief Read a whole file
 * @return Contents, or an error with code NOT_FOUND when the file is absent
 *         and IO for any other failure
 */
core::Result<std::string> ReadWholeFile(const std::string& path);

/**
 * @brief Replace a file with new contents
 *
 * Writes to a sibling temporary file and renames it over the target, so a
 * reader sees either the old or the new contents.
 */
core::Result<void> WriteWholeFile(const std::string& path, const std::string& data);

/**
 * @brief Remove a file; a missing file is not an error
 */
core::Result<void> RemoveFileIfExists(const std::string& path);

core::Result<uint64_t> FileSize(const std::string& path);

core::Result<void> EnsureDirectory(const std::string& path);

} // namespace storage
} // namespace usagedb
