#include <catch2/catch_test_macros.hpp>
#include <string>

#include "config/ConfigManager.hpp"
#include "config/RunConfig.hpp"
#include "utils/TempDir.hpp"

namespace
{

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("ConfigManager - loads files and log tables", "[config]")
{
    test_utils::TempDir dir("config");
    auto file = dir.write("demoji.toml", R"(
[files]
extensions = ["md", ".markdown"]
backup_suffix = ".orig"
atomic_writes = false

[log]
level = "debug"
file = "demoji.log"
)");

    RunConfig config;
    ConfigManager manager(file.string());
    manager.bindRunConfig(config);

    REQUIRE(manager.load());
    REQUIRE(config.extensions == std::vector<std::string>{ "md", ".markdown" });
    REQUIRE(config.backup_suffix == ".orig");
    REQUIRE_FALSE(config.atomic_writes);
    REQUIRE(config.log_level == plog::debug);
    REQUIRE(config.log_file == "demoji.log");
    REQUIRE(manager.root().contains("files"));
}

TEST_CASE("ConfigManager - missing tables keep defaults", "[config]")
{
    test_utils::TempDir dir("config");
    auto file = dir.write("empty.toml", "# nothing configured\n");

    RunConfig config;
    ConfigManager manager(file.string());
    manager.bindRunConfig(config);

    REQUIRE(manager.load());
    REQUIRE(config.extensions == std::vector<std::string>{ ".md" });
    REQUIRE(config.backup_suffix == ".bak");
    REQUIRE(config.atomic_writes);
    REQUIRE(config.log_level == plog::warning);
    REQUIRE(config.log_file.empty());
}

TEST_CASE("ConfigManager - unknown keys are tolerated", "[config]")
{
    test_utils::TempDir dir("config");
    auto file = dir.write("extra.toml", "[files]\nbackup_suffix = \".old\"\ncolour = \"blue\"\n\n[other]\nx = 1\n");

    RunConfig config;
    ConfigManager manager(file.string());
    manager.bindRunConfig(config);

    REQUIRE(manager.load());
    REQUIRE(config.backup_suffix == ".old");
    REQUIRE(manager.warnings().size() == 1);
    REQUIRE(contains(manager.warnings()[0], "Unknown key 'colour' in [files]"));
}

TEST_CASE("ConfigManager - a scalar where a table belongs is reported", "[config]")
{
    test_utils::TempDir dir("config");
    auto file = dir.write("scalar.toml", "log = \"debug\"\n");

    RunConfig config;
    ConfigManager manager(file.string());
    manager.bindRunConfig(config);

    REQUIRE(manager.load());
    REQUIRE(config.log_level == plog::warning);
    REQUIRE(manager.warnings().size() == 1);
    REQUIRE(contains(manager.warnings()[0], "[log] in " + file.string() + " is not a table"));

    SECTION("Warnings are reset on the next load")
    {
        dir.write("scalar.toml", "[log]\nlevel = \"info\"\n");
        REQUIRE(manager.load());
        REQUIRE(manager.warnings().empty());
        REQUIRE(config.log_level == plog::info);
    }
}

TEST_CASE("ConfigManager - reports load failures", "[config]")
{
    test_utils::TempDir dir("config");
    RunConfig config;

    SECTION("Missing file")
    {
        ConfigManager manager((dir.path() / "missing.toml").string());
        manager.bindRunConfig(config);
        REQUIRE_FALSE(manager.load());
        REQUIRE(contains(manager.lastError(), "Cannot open config file"));
    }

    SECTION("Syntax error")
    {
        auto file = dir.write("broken.toml", "[files\nextensions = [\n");
        ConfigManager manager(file.string());
        manager.bindRunConfig(config);
        REQUIRE_FALSE(manager.load());
        REQUIRE(contains(manager.lastError(), "config parse error"));
    }

    SECTION("Unknown log level")
    {
        auto file = dir.write("level.toml", "[log]\nlevel = \"loud\"\n");
        ConfigManager manager(file.string());
        manager.bindRunConfig(config);
        REQUIRE_FALSE(manager.load());
        REQUIRE(contains(manager.lastError(), "log.level"));
        REQUIRE(config.log_level == plog::warning);
    }

    SECTION("Extensions of the wrong type")
    {
        auto file = dir.write("ext.toml", "[files]\nextensions = \".md\"\n");
        ConfigManager manager(file.string());
        manager.bindRunConfig(config);
        REQUIRE_FALSE(manager.load());
        REQUIRE(contains(manager.lastError(), "files.extensions"));
    }

    SECTION("Empty extension list")
    {
        auto file = dir.write("ext.toml", "[files]\nextensions = []\n");
        ConfigManager manager(file.string());
        manager.bindRunConfig(config);
        REQUIRE_FALSE(manager.load());
        REQUIRE(config.extensions == std::vector<std::string>{ ".md" });
    }

    SECTION("Empty backup suffix")
    {
        auto file = dir.write("suffix.toml", "[files]\nbackup_suffix = \"\"\n");
        ConfigManager manager(file.string());
        manager.bindRunConfig(config);
        REQUIRE_FALSE(manager.load());
        REQUIRE(contains(manager.lastError(), "files.backup_suffix"));
    }
}

TEST_CASE("ConfigManager - duplicate key ownership is rejected", "[config]")
{
    ConfigManager manager("unused.toml");
    REQUIRE(manager.registerTable("files", { .load = [](const toml::table&) {} }, { "a", "b" }));
    REQUIRE_FALSE(manager.registerTable("files", { .load = [](const toml::table&) {} }, { "b" }));
    REQUIRE(contains(manager.lastError(), "Duplicate ownership"));
    REQUIRE(manager.registerTable("log", { .load = [](const toml::table&) {} }, { "b" }));
}

TEST_CASE("ConfigManager - nested table paths", "[config]")
{
    test_utils::TempDir dir("config");
    auto file = dir.write("nested.toml", "[outer.inner]\nvalue = 7\n");

    int seen = 0;
    ConfigManager manager(file.string());
    manager.registerTable("outer.inner",
                          { .load =
                                [&seen](const toml::table& section)
                                {
                                    seen = section["value"].value_or(0);
                                } },
                          { "value" });

    REQUIRE(manager.load());
    REQUIRE(seen == 7);
}

TEST_CASE("RunConfig - validate reports conflicting options", "[config]")
{
    RunConfig config;
    config.path = "notes.md";
    REQUIRE(config.validate().empty());

    SECTION("Output with recursive")
    {
        config.recursive = true;
        config.output = "out.md";
        auto warnings = config.validate();
        REQUIRE(warnings.size() == 1);
        REQUIRE(contains(warnings[0], "--output is ignored"));
        REQUIRE_FALSE(config.usesOutputFile());
    }

    SECTION("Backup without in-place writes")
    {
        config.backup = true;
        auto warnings = config.validate();
        REQUIRE(warnings.size() == 1);
        REQUIRE(contains(warnings[0], "--backup"));
    }

    SECTION("Output in single file mode")
    {
        config.output = "out.md";
        REQUIRE(config.validate().empty());
        REQUIRE(config.usesOutputFile());
    }
}

TEST_CASE("ParseSeverity - accepts plog level names", "[config]")
{
    REQUIRE(ParseSeverity("debug") == plog::debug);
    REQUIRE(ParseSeverity("WARNING") == plog::warning);
    REQUIRE(ParseSeverity("warn") == plog::warning);
    REQUIRE(ParseSeverity("none") == plog::none);
    REQUIRE(ParseSeverity("verbose") == plog::verbose);
    REQUIRE_FALSE(ParseSeverity("loud").has_value());
    REQUIRE_FALSE(ParseSeverity("").has_value());
}
