#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace files
{

enum class ErrorKind
{
    PathNotFound,                  // --path does not exist
    NotMarkdown,                   // Single file without a markdown extension
    NotADirectoryWithoutRecursive, // Directory given without --recursive
    IoReadError,                   // Unreadable file or invalid UTF-8
    IoWriteError,                  // Destination, temp or backup write failed
    InvalidConfig                  // --config file missing or malformed
};

[[nodiscard]] const char* ToString(ErrorKind kind) noexcept;

class FileError : public std::runtime_error
{
public:
    FileError(ErrorKind kind, std::filesystem::path path, const std::string& cause);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    ErrorKind kind_;
    std::filesystem::path path_;
    std::string cause_;
};

} // namespace files
