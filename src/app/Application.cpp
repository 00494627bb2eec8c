#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "files/FileError.hpp"
#include "pipeline/ProcessingPipeline.hpp"
#include "processing/EmojiTable.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <getopt.h>

#include <iostream>
#include <ostream>
#include <string>

#include <plog/Log.h>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

const option kLongOptions[] = {
    { "path", required_argument, nullptr, 'p' },
    { "recursive", no_argument, nullptr, 'r' },
    { "output", required_argument, nullptr, 'o' },
    { "verbose", no_argument, nullptr, 'v' },
    { "dry-run", no_argument, nullptr, 'd' },
    { "backup", no_argument, nullptr, 'b' },
    { "config", required_argument, nullptr, 'c' },
    { "help", no_argument, nullptr, 'h' },
    { "version", no_argument, nullptr, 'V' },
    { nullptr, 0, nullptr, 0 },
};

// Leading ':' reports a missing value as ':' instead of '?'
constexpr const char* kShortOptions = ":p:ro:vdbc:hV";

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

void Application::PrintUsage(std::ostream& os, const char* program)
{
    os << "Remove emojis from markdown files\n"
          "\n"
          "Strips emojis from a single markdown file or, with --recursive, from every\n"
          "markdown file below a directory.\n"
          "\n"
          "Usage: "
       << program
       << " --path <PATH> [OPTIONS]\n"
          "\n"
          "Options:\n"
          "  -p, --path <PATH>     Path to a markdown file or directory containing .md files\n"
          "  -r, --recursive       Recursively process all .md files in the directory (replaces files in-place)\n"
          "  -o, --output <FILE>   Output file path (only works with single file mode, ignored with --recursive)\n"
          "  -v, --verbose         Show detailed processing information\n"
          "  -d, --dry-run         Preview changes without modifying files\n"
          "  -b, --backup          Create backup files (.bak) before modifying (only with --recursive)\n"
          "  -c, --config <FILE>   Read extra settings from a TOML file\n"
          "  -h, --help            Print help\n"
          "  -V, --version         Print version\n";
}

std::optional<int> Application::ParseCommandLineArgs(int argc, char** argv, RunConfig& config, std::ostream& out,
                                                     std::ostream& err)
{
    const char* program = argc > 0 ? argv[0] : app::kProgramName;
    bool have_path = false;

    // 0 makes glibc reinitialise its scanner, so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    int opt = 0;
    int opt_idx = 0;
    while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions, &opt_idx)) != -1)
    {
        switch (opt)
        {
        case 'p':
            config.path = optarg;
            have_path = true;
            break;
        case 'r':
            config.recursive = true;
            break;
        case 'o':
            config.output = std::filesystem::path(optarg);
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'd':
            config.dry_run = true;
            break;
        case 'b':
            config.backup = true;
            break;
        case 'c':
            config.config_file = std::filesystem::path(optarg);
            break;
        case 'h':
            PrintUsage(out, program);
            return kExitOk;
        case 'V':
            out << app::kProgramName << ' ' << app::kVersion << " (emoji data "
                << processing::emojiTableVersion() << ")\n";
            return kExitOk;
        case ':':
            err << "error: option '" << (optopt ? std::string(1, static_cast<char>(optopt)) : argv[optind - 1])
                << "' requires a value\n";
            err << "(try using -h or --help for more info)\n";
            return kExitUsage;
        default:
            err << "error: unexpected argument '"
                << (optopt ? "-" + std::string(1, static_cast<char>(optopt)) : std::string(argv[optind - 1]))
                << "'\n";
            err << "(try using -h or --help for more info)\n";
            return kExitUsage;
        }
    }

    if (optind < argc)
    {
        err << "error: unexpected argument '" << argv[optind] << "'\n";
        err << "(try using -h or --help for more info)\n";
        return kExitUsage;
    }

    if (!have_path || config.path.empty())
    {
        err << "error: the following required arguments were not provided:\n  --path <PATH>\n\n";
        PrintUsage(err, program);
        return kExitUsage;
    }

    return std::nullopt;
}

void Application::initializeConfig()
{
    if (!config_.config_file)
        return;

    ConfigManager manager(config_.config_file->string());
    manager.bindRunConfig(config_);
    if (!manager.load())
        throw files::FileError(files::ErrorKind::InvalidConfig, *config_.config_file, manager.lastError());
    config_warnings_ = manager.warnings();
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    // --verbose only turns on the per-file report; log verbosity comes from [log] level
    return utils::LogManager::Initialize({ .name = "main",
                                           .filepath = config_.log_file,
                                           .level = config_.log_level,
                                           .max_file_size = 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = true });
}

int Application::run()
{
    if (auto exit_code = ParseCommandLineArgs(argc_, argv_, config_, std::cout, std::cerr))
        return *exit_code;

    try
    {
        // Before logging, so [log] settings apply; nothing has been touched yet
        initializeConfig();
    }
    catch (const files::FileError& ex)
    {
        std::cerr << "Error: " << ex.what() << '\n';
        return kExitFailure;
    }

    if (!initializeLogging())
        return kExitFailure;

    for (const auto& warning : config_warnings_)
        PLOG_WARNING << "Warning: " << warning;

    PLOG_DEBUG << app::kProgramName << ' ' << app::kVersion << " starting, path=" << config_.path.string()
               << " recursive=" << config_.recursive << " dry_run=" << config_.dry_run
               << " backup=" << config_.backup;

    try
    {
        pipeline::ProcessingPipeline pipeline(config_, std::cout, std::cerr);
        const pipeline::RunSummary summary = pipeline.run();
        return summary.exitCode();
    }
    catch (const files::FileError& ex)
    {
        PLOG_DEBUG << "Run aborted: " << files::ToString(ex.kind()) << " " << ex.path().string();
        std::cerr << "Error: " << ex.what() << '\n';
        return kExitFailure;
    }
}

void Application::cleanup() { utils::LogManager::Shutdown(); }
