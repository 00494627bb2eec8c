#include "ProcessingPipeline.hpp"

#include "files/FileError.hpp"
#include "files/FileResolver.hpp"
#include "files/FileWriter.hpp"
#include "processing/EmojiStripper.hpp"
#include "processing/StageRunner.hpp"
#include "processing/TextUtils.hpp"
#include "utils/Profile.hpp"

#include <ostream>
#include <utility>

#include <plog/Log.h>

namespace pipeline
{

namespace
{

std::string describe(const files::Destination& destination)
{
    if (destination.kind == files::DestinationKind::Stdout)
        return "stdout";
    return destination.path.string();
}

std::string readValidated(const std::filesystem::path& path)
{
    std::string content = files::readFile(path);
    if (auto bad = processing::findInvalidUtf8(content))
    {
        throw files::FileError(files::ErrorKind::IoReadError, path,
                               "File is not valid UTF-8 (byte " + std::to_string(*bad) + ")");
    }
    return content;
}

} // anonymous namespace

const char* ToString(FileState state) noexcept
{
    switch (state)
    {
    case FileState::Read:
        return "read";
    case FileState::Stripped:
        return "stripped";
    case FileState::ResolvedDestination:
        return "resolved_destination";
    case FileState::Written:
        return "written";
    case FileState::Skipped:
        return "skipped";
    case FileState::BackedUpWritten:
        return "backed_up_written";
    case FileState::Failed:
        return "failed";
    }
    return "unknown";
}

struct ProcessingPipeline::Impl
{
    Impl(RunConfig cfg, std::ostream& out_stream, std::ostream& diag_stream)
        : config(std::move(cfg))
        , resolver(config.extensions)
        , out(out_stream)
        , diag(diag_stream)
    {
    }

    FileOutcome fail(FileOutcome outcome, const text_processing::StageResult<bool>& stage)
    {
        return fail(std::move(outcome), stage.stage_name, stage.error.value_or("unknown error"));
    }

    FileOutcome fail(FileOutcome outcome, const std::string& stage, const std::string& reason)
    {
        PLOG_DEBUG << "[Pipeline] file=" << outcome.target.path.string() << " stage=" << stage
                   << " status=error reason=" << reason;
        diag << "Error processing " << outcome.target.path.string() << ": " << reason << '\n';
        outcome.state = FileState::Failed;
        outcome.error = reason;
        return outcome;
    }

    void writeDestination(const files::FileTarget& target, const std::string& text)
    {
        switch (target.destination.kind)
        {
        case files::DestinationKind::Stdout:
            out << text;
            out.flush();
            if (!out)
                throw files::FileError(files::ErrorKind::IoWriteError, target.path, "Could not write to stdout");
            return;
        case files::DestinationKind::OutputFile:
        case files::DestinationKind::InPlace:
            if (config.atomic_writes)
                files::writeFileAtomic(target.destination.path, text);
            else
                files::writeFile(target.destination.path, text);
            return;
        }
    }

    RunConfig config;
    files::FileResolver resolver;
    std::ostream& out;
    std::ostream& diag;
};

ProcessingPipeline::ProcessingPipeline(RunConfig config, std::ostream& out, std::ostream& diag)
    : impl_(std::make_unique<Impl>(std::move(config), out, diag))
{
}

ProcessingPipeline::~ProcessingPipeline() = default;

files::Destination ProcessingPipeline::resolveDestination(const files::FileTarget& target, const RunConfig& config)
{
    files::Destination destination;
    if (target.mode == files::TargetMode::RecursiveMember)
    {
        destination.kind = files::DestinationKind::InPlace;
        destination.path = target.path;
    }
    else if (config.usesOutputFile())
    {
        destination.kind = files::DestinationKind::OutputFile;
        destination.path = *config.output;
    }
    else
    {
        destination.kind = files::DestinationKind::Stdout;
    }
    return destination;
}

RunSummary ProcessingPipeline::run()
{
    PROFILE_SCOPE_FUNCTION();

    for (const auto& warning : impl_->config.validate())
        PLOG_WARNING << "Warning: " << warning;

    // Throws before any file is touched
    std::vector<files::FileTarget> targets = impl_->resolver.resolve(impl_->config.path, impl_->config.recursive);

    const bool directory_mode = !targets.empty() && targets.front().mode == files::TargetMode::RecursiveMember;
    if (directory_mode && (impl_->config.verbose || impl_->config.dry_run))
        impl_->diag << "Scanning directory: " << impl_->config.path.string() << "\n\n";

    if (targets.empty())
        PLOG_INFO << "No markdown files found under " << impl_->config.path.string();

    return processAll(std::move(targets));
}

RunSummary ProcessingPipeline::processAll(std::vector<files::FileTarget> targets)
{
    RunSummary summary;
    bool batch = false;

    for (auto& target : targets)
    {
        batch = batch || target.mode == files::TargetMode::RecursiveMember;

        FileOutcome outcome = processTarget(std::move(target));
        if (outcome.succeeded())
        {
            ++summary.processed;
            summary.removed_spans += outcome.removed_spans;
        }
        else
        {
            ++summary.failed;
        }
        summary.outcomes.push_back(std::move(outcome));
    }

    if (batch || summary.failed > 0)
    {
        impl_->diag << "\nCompleted: " << summary.processed << " files processed, " << summary.failed << " errors\n";
    }

    PLOG_INFO << "[Pipeline] processed=" << summary.processed << " failed=" << summary.failed
              << " removed_spans=" << summary.removed_spans;
    return summary;
}

FileOutcome ProcessingPipeline::processTarget(files::FileTarget target)
{
    PROFILE_SCOPE_FUNCTION();

    const RunConfig& config = impl_->config;
    FileOutcome outcome;
    outcome.target = std::move(target);
    const std::string display = outcome.target.path.string();

    auto read_stage = processing::run_stage<std::string>("read",
                                                         [&]()
                                                         {
                                                             return readValidated(outcome.target.path);
                                                         });
    if (!read_stage.succeeded)
        return impl_->fail(std::move(outcome), read_stage.stage_name, read_stage.error.value_or("unknown error"));
    outcome.state = FileState::Read;

    auto strip_stage = processing::run_stage<text_processing::StripResult>("strip",
                                                                          [&]()
                                                                          {
                                                                              return processing::strip(read_stage.result);
                                                                          });
    if (!strip_stage.succeeded)
        return impl_->fail(std::move(outcome), strip_stage.stage_name, strip_stage.error.value_or("unknown error"));
    const text_processing::StripResult& stripped = strip_stage.result;
    outcome.state = FileState::Stripped;
    outcome.removed_spans = stripped.removed_spans;
    outcome.original_bytes = stripped.original_bytes;
    outcome.cleaned_bytes = stripped.text.size();

    outcome.target.destination = resolveDestination(outcome.target, config);
    outcome.state = FileState::ResolvedDestination;

    if (config.dry_run)
    {
        impl_->diag << "[DRY RUN] Would process: " << display << " (" << stripped.removed_spans << " emoji, "
                    << stripped.original_bytes << " -> " << stripped.text.size() << " bytes)\n";
        outcome.state = FileState::Skipped;
        return outcome;
    }

    bool backed_up = false;
    if (config.backup && outcome.target.writesInPlace())
    {
        auto backup_stage = processing::run_stage<bool>("backup",
                                                        [&]()
                                                        {
                                                            auto backup_path = files::createBackup(
                                                                outcome.target.path, read_stage.result,
                                                                config.backup_suffix);
                                                            if (config.verbose)
                                                                impl_->diag << "Created backup: "
                                                                            << backup_path.string() << '\n';
                                                            return true;
                                                        });
        // The original must stay untouched when its backup could not be written
        if (!backup_stage.succeeded)
            return impl_->fail(std::move(outcome), backup_stage);
        backed_up = true;
    }

    auto write_stage = processing::run_stage<bool>("write",
                                                   [&]()
                                                   {
                                                       impl_->writeDestination(outcome.target, stripped.text);
                                                       return true;
                                                   });
    if (!write_stage.succeeded)
        return impl_->fail(std::move(outcome), write_stage);

    outcome.state = backed_up ? FileState::BackedUpWritten : FileState::Written;

    if (config.verbose)
    {
        impl_->diag << "Processed: " << display << " (" << stripped.removed_spans << " emoji removed) -> "
                    << describe(outcome.target.destination) << '\n';
    }

    PLOG_DEBUG << "[Pipeline] file=" << display << " state=" << ToString(outcome.state)
               << " removed=" << stripped.removed_spans
               << " destination=" << files::ToString(outcome.target.destination.kind) << " "
               << describe(outcome.target.destination);
    return outcome;
}

} // namespace pipeline
