// Catch2WithMain provides main(); this file only holds the build smoke test

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "app/Version.hpp"
#include "processing/EmojiStripper.hpp"

TEST_CASE("Build smoke test", "[smoke]")
{
    REQUIRE(std::string(app::kProgramName) == "demoji");
    REQUIRE_FALSE(std::string(app::kVersion).empty());
    REQUIRE(processing::strip("ok \xE2\x9C\x85").text == "ok ");
}
