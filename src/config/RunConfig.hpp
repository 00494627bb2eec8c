#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

// Options for one run, built once from the command line (and --config) and
// read-only afterwards.
struct RunConfig
{
    std::filesystem::path path;
    bool recursive = false;
    std::optional<std::filesystem::path> output;
    bool verbose = false;
    bool dry_run = false;
    bool backup = false;

    std::optional<std::filesystem::path> config_file;

    // [files]
    std::vector<std::string> extensions = { ".md" };
    std::string backup_suffix = ".bak";
    bool atomic_writes = true;

    // [log]
    plog::Severity log_level = plog::warning;
    std::string log_file;

    // Non-fatal option conflicts, one message per conflict
    [[nodiscard]] std::vector<std::string> validate() const;

    // --output is honoured only outside recursive mode
    [[nodiscard]] bool usesOutputFile() const { return output.has_value() && !recursive; }
};

[[nodiscard]] std::optional<plog::Severity> ParseSeverity(const std::string& name);
