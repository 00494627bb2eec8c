#pragma once

#include <filesystem>
#include <system_error>

namespace files
{

enum class TargetMode
{
    SingleFile,     // --path named a file
    RecursiveMember // Found while walking a directory
};

enum class DestinationKind
{
    Stdout,
    OutputFile,
    InPlace
};

struct Destination
{
    DestinationKind kind = DestinationKind::Stdout;
    std::filesystem::path path; // Empty for Stdout
};

// One file to process. Lives only for the duration of its pipeline pass.
struct FileTarget
{
    std::filesystem::path path;
    TargetMode mode = TargetMode::SingleFile;
    Destination destination;

    // True when the write replaces the source file, including --output pointing back at it
    [[nodiscard]] bool writesInPlace() const
    {
        if (destination.kind == DestinationKind::InPlace)
            return true;
        if (destination.kind != DestinationKind::OutputFile)
            return false;

        std::error_code ec_dest;
        std::error_code ec_src;
        auto dest = std::filesystem::weakly_canonical(destination.path, ec_dest);
        auto src = std::filesystem::weakly_canonical(path, ec_src);
        if (ec_dest || ec_src)
            return destination.path == path;
        return dest == src;
    }
};

[[nodiscard]] inline const char* ToString(DestinationKind kind) noexcept
{
    switch (kind)
    {
    case DestinationKind::Stdout:
        return "stdout";
    case DestinationKind::OutputFile:
        return "output file";
    case DestinationKind::InPlace:
        return "in place";
    }
    return "unknown";
}

} // namespace files
