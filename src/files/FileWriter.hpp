#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace files
{

// All functions throw FileError on failure.

/// Reads the whole file as bytes (IoReadError)
[[nodiscard]] std::string readFile(const std::filesystem::path& path);

/// Writes bytes straight to @p path, truncating it (IoWriteError)
void writeFile(const std::filesystem::path& path, std::string_view content);

/// Writes to "<path>.tmp" and renames it over @p path, so an interrupted run
/// leaves either the old file or the new one (IoWriteError).
/// The new file keeps the permission bits of the one it replaces, and a
/// symlinked @p path is written through to its target.
void writeFileAtomic(const std::filesystem::path& path, std::string_view content);

/// Stores @p original as "<path><suffix>" with the permissions of @p path and
/// returns the backup path (IoWriteError).
/// Must complete before the source file is replaced.
std::filesystem::path createBackup(const std::filesystem::path& path, std::string_view original,
                                   const std::string& suffix = ".bak");

} // namespace files
