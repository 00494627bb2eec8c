#pragma once

#include "config/RunConfig.hpp"
#include "files/FileTarget.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pipeline
{

enum class FileState
{
    Read,
    Stripped,
    ResolvedDestination,
    Written,
    Skipped,
    BackedUpWritten,
    Failed
};

[[nodiscard]] const char* ToString(FileState state) noexcept;

struct FileOutcome
{
    files::FileTarget target;
    FileState state = FileState::Read;
    std::size_t removed_spans = 0;
    std::size_t original_bytes = 0;
    std::size_t cleaned_bytes = 0;
    std::optional<std::string> error;

    [[nodiscard]] bool succeeded() const noexcept { return state != FileState::Failed; }
};

struct RunSummary
{
    std::size_t processed = 0;
    std::size_t failed = 0;
    std::size_t removed_spans = 0;
    std::vector<FileOutcome> outcomes;

    [[nodiscard]] bool ok() const noexcept { return failed == 0; }
    [[nodiscard]] int exitCode() const noexcept { return ok() ? 0 : 1; }
};

/**
 * @brief Applies the emoji stripper to every file a run resolves to
 *
 * Per file: read -> strip -> pick destination -> (dry-run skip | backup -> write).
 * A failure in one file is recorded in its outcome and the batch moves on;
 * only an invalid --path aborts, by throwing files::FileError from run().
 *
 * @p out receives cleaned text in stdout mode, @p diag receives reports.
 */
class ProcessingPipeline
{
public:
    ProcessingPipeline(RunConfig config, std::ostream& out, std::ostream& diag);
    ~ProcessingPipeline();

    ProcessingPipeline(const ProcessingPipeline&) = delete;
    ProcessingPipeline& operator=(const ProcessingPipeline&) = delete;

    [[nodiscard]] RunSummary run();

    [[nodiscard]] RunSummary processAll(std::vector<files::FileTarget> targets);
    [[nodiscard]] FileOutcome processTarget(files::FileTarget target);

    [[nodiscard]] static files::Destination resolveDestination(const files::FileTarget& target,
                                                               const RunConfig& config);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pipeline
