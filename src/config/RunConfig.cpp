#include "RunConfig.hpp"

#include <algorithm>
#include <cctype>

std::vector<std::string> RunConfig::validate() const
{
    std::vector<std::string> warnings;

    if (output && recursive)
        warnings.push_back("--output is ignored when --recursive is set; files are rewritten in place");

    if (backup && !recursive && !output)
        warnings.push_back("--backup has no effect without --recursive; output goes to stdout");

    if (backup_suffix.empty())
        warnings.push_back("files.backup_suffix is empty; backups would overwrite the original");

    return warnings;
}

std::optional<plog::Severity> ParseSeverity(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c)
                   {
                       return static_cast<char>(std::tolower(c));
                   });

    if (lower == "none")
        return plog::none;
    if (lower == "fatal")
        return plog::fatal;
    if (lower == "error")
        return plog::error;
    if (lower == "warning" || lower == "warn")
        return plog::warning;
    if (lower == "info")
        return plog::info;
    if (lower == "debug")
        return plog::debug;
    if (lower == "verbose")
        return plog::verbose;
    return std::nullopt;
}
