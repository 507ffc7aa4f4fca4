#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "tbhook/hooking/HookManager.hpp"
#include "tbhook/policies/RewardToken.hpp"
#include "tbhook/setup/HookSettings.hpp"
#include "tbhook/setup/ReplayCodec.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <fstream>
#include <iostream>
#include <map>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace
{

void PrintUsage(const char* program)
{
    std::cerr << "usage: " << program << " <config.toml> <requests.jsonl>\n";
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

int Application::run()
{
    if (!parseArguments())
    {
        PrintUsage(argc_ > 0 ? argv_[0] : "tbhook_replay");
        return 1;
    }

    if (!initializeLogging())
        return 1;

    if (!initializeHooks())
    {
        drainErrors();
        return 1;
    }

    const bool replayed = replay();
    const bool fatal = drainErrors();
    return replayed && !fatal ? 0 : 1;
}

bool Application::parseArguments()
{
    if (argc_ != 3)
        return false;

    config_path_ = argv_[1];
    requests_path_ = argv_[2];
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(config_path_))
    {
        std::cerr << "Failed to initialize logging: " << utils::LogManager::LastError() << "\n";
        return false;
    }

    utils::LogManager::LoggerConfig logger_config;
    logger_config.name = "main";
    logger_config.filepath = "logs/replay.log";
    if (!utils::LogManager::RegisterLogger<0>(logger_config))
    {
        std::cerr << "Failed to register logger: " << utils::LogManager::LastError() << "\n";
        return false;
    }

    PLOG_INFO << "tbhook_replay starting (config=" << config_path_ << ", requests=" << requests_path_ << ")";
    return true;
}

bool Application::initializeHooks()
{
    config_ = std::make_unique<ConfigManager>(config_path_);
    settings_ = std::make_unique<tbhook::HookSettings>();

    if (!tbhook::RegisterHookSettings(*config_, *settings_) || !config_->load())
    {
        std::cerr << "Configuration error: " << config_->lastError() << "\n";
        return false;
    }

    manager_ = std::make_unique<tbhook::HookManager>(settings_->orchestrator);
    if (!tbhook::BuildReferenceHooks(*settings_, *manager_, tbhook::SystemTime, reward_token_))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to build hooks");
        return false;
    }

    return true;
}

bool Application::replay()
{
    std::ifstream input(requests_path_);
    if (!input)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Cannot open requests file",
                                          requests_path_);
        std::cerr << "Cannot open " << requests_path_ << "\n";
        return false;
    }

    std::size_t line_number = 0;
    std::size_t executed = 0;
    std::size_t committed = 0;
    std::string line;
    while (std::getline(input, line))
    {
        ++line_number;
        if (line.empty() || line[0] == '#')
            continue;

        tbhook::ReplayRequest request;
        std::string error;
        if (!tbhook::ParseReplayRequest(line, settings_->orchestrator, request, error))
        {
            PLOG_WARNING << "Skipping line " << line_number << ": " << error;
            continue;
        }

        const auto target = request.target;
        auto outcome = manager_->executeAs(request.invoker, request.params,
                                           [&target](const tbhook::HookParams&) { return target; });

        ++executed;
        if (outcome.committed)
            ++committed;

        std::cout << tbhook::OutcomeToJson(outcome, request.params).dump() << "\n";
    }

    PLOG_INFO << "Replayed " << executed << " execution(s), " << committed << " committed, "
              << (executed - committed) << " aborted";
    return true;
}

// Returns true if any fatal report was pending. The queue is bounded, so
// the counts cover the most recent reports only.
bool Application::drainErrors()
{
    const auto reports = utils::ErrorReporter::GetPendingErrors();

    bool fatal = false;
    std::map<utils::ErrorSeverity, std::size_t> counts;
    for (const auto& report : reports)
    {
        ++counts[report.severity];
        if (report.is_fatal)
        {
            fatal = true;
            std::cerr << "[" << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
            if (!report.technical_details.empty())
                std::cerr << ": " << report.technical_details;
            std::cerr << "\n";
        }
    }

    for (const auto& [severity, count] : counts)
    {
        PLOG_INFO << count << " " << utils::ErrorReporter::SeverityToString(severity) << " report(s) this run";
    }
    return fatal;
}
