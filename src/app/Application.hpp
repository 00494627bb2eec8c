#pragma once

#include "config/RunConfig.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

    // Fills @p config from argv. Returns an exit code when the process should stop
    // right away (--help, --version, usage errors).
    static std::optional<int> ParseCommandLineArgs(int argc, char** argv, RunConfig& config, std::ostream& out,
                                                   std::ostream& err);

    static void PrintUsage(std::ostream& os, const char* program);

private:
    // Throws files::FileError (InvalidConfig)
    void initializeConfig();
    bool initializeLogging();
    void cleanup();

    RunConfig config_;
    // Collected while reading the config, logged once the logger exists
    std::vector<std::string> config_warnings_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
