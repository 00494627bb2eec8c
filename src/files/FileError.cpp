#include "FileError.hpp"

#include <utility>

namespace files
{

const char* ToString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::PathNotFound:
        return "PathNotFound";
    case ErrorKind::NotMarkdown:
        return "NotMarkdown";
    case ErrorKind::NotADirectoryWithoutRecursive:
        return "NotADirectoryWithoutRecursive";
    case ErrorKind::IoReadError:
        return "IoReadError";
    case ErrorKind::IoWriteError:
        return "IoWriteError";
    case ErrorKind::InvalidConfig:
        return "InvalidConfig";
    }
    return "Unknown";
}

FileError::FileError(ErrorKind kind, std::filesystem::path path, const std::string& cause)
    : std::runtime_error(cause)
    , kind_(kind)
    , path_(std::move(path))
    , cause_(cause)
{
}

} // namespace files
