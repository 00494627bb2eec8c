#pragma once

#include "FileTarget.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace files
{

/**
 * @brief Turns the --path argument into the list of files to process
 *
 * A regular file yields one SingleFile target whatever the recursive flag says.
 * A directory requires recursive mode and yields one RecursiveMember target per
 * markdown file below it, sorted by path so repeated runs report in the same order.
 *
 * Throws FileError (PathNotFound, NotMarkdown, NotADirectoryWithoutRecursive).
 */
class FileResolver
{
public:
    explicit FileResolver(std::vector<std::string> extensions = { ".md" });

    [[nodiscard]] std::vector<FileTarget> resolve(const std::filesystem::path& path, bool recursive) const;

    [[nodiscard]] bool isMarkdown(const std::filesystem::path& path) const;

    [[nodiscard]] const std::vector<std::string>& extensions() const noexcept { return extensions_; }

private:
    std::vector<FileTarget> walk(const std::filesystem::path& root) const;

    std::vector<std::string> extensions_;
};

} // namespace files
