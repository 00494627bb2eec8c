#include <catch2/catch_test_macros.hpp>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "app/Application.hpp"

namespace
{

// getopt wants a mutable, null-terminated argv
struct Args
{
    Args(std::initializer_list<std::string> list)
        : storage(list)
    {
        for (auto& arg : storage)
            pointers.push_back(arg.data());
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

struct ParseOutcome
{
    std::optional<int> exit_code;
    RunConfig config;
    std::string out;
    std::string err;
};

ParseOutcome parse(std::initializer_list<std::string> list)
{
    Args args(list);
    ParseOutcome outcome;
    std::ostringstream out;
    std::ostringstream err;
    outcome.exit_code = Application::ParseCommandLineArgs(args.argc(), args.argv(), outcome.config, out, err);
    outcome.out = out.str();
    outcome.err = err.str();
    return outcome;
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Command line - path only", "[cli]")
{
    auto parsed = parse({ "demoji", "--path", "notes.md" });

    REQUIRE_FALSE(parsed.exit_code.has_value());
    REQUIRE(parsed.config.path == std::filesystem::path("notes.md"));
    REQUIRE_FALSE(parsed.config.recursive);
    REQUIRE_FALSE(parsed.config.output.has_value());
    REQUIRE_FALSE(parsed.config.verbose);
    REQUIRE_FALSE(parsed.config.dry_run);
    REQUIRE_FALSE(parsed.config.backup);
    REQUIRE_FALSE(parsed.config.config_file.has_value());
    REQUIRE(parsed.err.empty());
}

TEST_CASE("Command line - every short flag", "[cli]")
{
    auto parsed = parse({ "demoji", "-p", "docs", "-r", "-o", "out.md", "-v", "-d", "-b", "-c", "demoji.toml" });

    REQUIRE_FALSE(parsed.exit_code.has_value());
    REQUIRE(parsed.config.path == std::filesystem::path("docs"));
    REQUIRE(parsed.config.recursive);
    REQUIRE(parsed.config.output == std::filesystem::path("out.md"));
    REQUIRE(parsed.config.verbose);
    REQUIRE(parsed.config.dry_run);
    REQUIRE(parsed.config.backup);
    REQUIRE(parsed.config.config_file == std::filesystem::path("demoji.toml"));
}

TEST_CASE("Command line - long flags and combined short flags", "[cli]")
{
    auto parsed = parse({ "demoji", "--path=docs", "--recursive", "--dry-run", "--backup", "--verbose" });
    REQUIRE_FALSE(parsed.exit_code.has_value());
    REQUIRE(parsed.config.path == std::filesystem::path("docs"));
    REQUIRE(parsed.config.recursive);
    REQUIRE(parsed.config.dry_run);

    auto combined = parse({ "demoji", "-rvd", "-p", "docs" });
    REQUIRE_FALSE(combined.exit_code.has_value());
    REQUIRE(combined.config.recursive);
    REQUIRE(combined.config.verbose);
    REQUIRE(combined.config.dry_run);
}

TEST_CASE("Command line - help and version exit with success", "[cli]")
{
    auto help = parse({ "demoji", "--help" });
    REQUIRE(help.exit_code == 0);
    REQUIRE(contains(help.out, "Usage: demoji --path <PATH>"));
    REQUIRE(contains(help.out, "--dry-run"));

    auto version = parse({ "demoji", "-V" });
    REQUIRE(version.exit_code == 0);
    REQUIRE(contains(version.out, "demoji "));
    REQUIRE(contains(version.out, "(emoji data 15.1)"));
}

TEST_CASE("Command line - usage errors exit with 2", "[cli]")
{
    SECTION("Missing --path")
    {
        auto parsed = parse({ "demoji", "--recursive" });
        REQUIRE(parsed.exit_code == 2);
        REQUIRE(contains(parsed.err, "--path <PATH>"));
    }

    SECTION("Missing option value")
    {
        auto parsed = parse({ "demoji", "-p" });
        REQUIRE(parsed.exit_code == 2);
        REQUIRE(contains(parsed.err, "requires a value"));
    }

    SECTION("Unknown long option")
    {
        auto parsed = parse({ "demoji", "-p", "a.md", "--bogus" });
        REQUIRE(parsed.exit_code == 2);
        REQUIRE(contains(parsed.err, "unexpected argument '--bogus'"));
    }

    SECTION("Unknown short option")
    {
        auto parsed = parse({ "demoji", "-p", "a.md", "-x" });
        REQUIRE(parsed.exit_code == 2);
        REQUIRE(contains(parsed.err, "unexpected argument '-x'"));
    }

    SECTION("Stray positional argument")
    {
        auto parsed = parse({ "demoji", "-p", "a.md", "extra" });
        REQUIRE(parsed.exit_code == 2);
        REQUIRE(contains(parsed.err, "unexpected argument 'extra'"));
    }

    SECTION("Empty path")
    {
        auto parsed = parse({ "demoji", "--path", "" });
        REQUIRE(parsed.exit_code == 2);
    }
}

TEST_CASE("Application - bad config file fails before processing", "[cli]")
{
    Args args({ "demoji", "-p", "missing-input.md", "-c", "/nonexistent/demoji.toml" });
    Application app(args.argc(), args.argv());
    REQUIRE(app.run() == 1);
}
