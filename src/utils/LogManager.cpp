#include "LogManager.hpp"

#include <filesystem>
#include <iostream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/MessageOnlyFormatter.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

namespace
{

// plog cannot drop an appender once added, so the logger only ever holds this one
// and it forwards to whatever LogManager currently owns.
class ForwardingAppender : public plog::IAppender
{
public:
    explicit ForwardingAppender(const std::vector<std::unique_ptr<plog::IAppender>>& targets)
        : targets_(targets)
    {
    }

    void write(const plog::Record& record) override
    {
        for (const auto& target : targets_)
            target->write(record);
    }

private:
    const std::vector<std::unique_ptr<plog::IAppender>>& targets_;
};

bool g_forwarder_attached = false;

} // namespace

bool LogManager::Initialize(const LoggerConfig& config)
{
    if (s_initialized)
        return true;

    try
    {
        // Later calls get the same static logger back, still at the old severity
        plog::Logger<PLOG_DEFAULT_INSTANCE_ID>& logger = plog::init(config.level);
        logger.setMaxSeverity(config.level);
        if (!g_forwarder_attached)
        {
            static ForwardingAppender forwarder(s_appenders);
            logger.addAppender(&forwarder);
            g_forwarder_attached = true;
        }

        if (config.add_console_appender)
        {
            s_appenders.push_back(
                std::make_unique<plog::ConsoleAppender<plog::MessageOnlyFormatter>>(plog::streamStdErr));
        }

        if (!config.filepath.empty())
        {
            std::error_code ec;
            const auto parent = std::filesystem::path(config.filepath).parent_path();
            if (!parent.empty())
                std::filesystem::create_directories(parent, ec);

            s_appenders.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count)));
        }

        s_initialized = true;
        PLOG_DEBUG << "Logger '" << config.name << "' ready at severity " << plog::severityToString(config.level);
        return true;
    }
    catch (const std::exception& ex)
    {
        s_appenders.clear();
        std::cerr << "Failed to register logger " << config.name << ": " << ex.what() << '\n';
        return false;
    }
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get())
        logger->setMaxSeverity(plog::none);
    // The logger only points at the forwarder, which now has nothing to forward to
    s_appenders.clear();
    s_initialized = false;
}

} // namespace utils
