#pragma once

#include <memory>
#include <string>

class ConfigManager;

namespace tbhook
{
class HookManager;
class LedgerRewardToken;
struct HookSettings;
} // namespace tbhook

/// tbhook_replay: builds the configured reference hooks and runs every
/// execution request of a JSONL file through the HookManager, writing one
/// JSON outcome per line to stdout.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool parseArguments();
    bool initializeLogging();
    bool initializeHooks();
    bool replay();
    bool drainErrors();

    int argc_;
    char** argv_;
    std::string config_path_;
    std::string requests_path_;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<tbhook::HookSettings> settings_;
    std::unique_ptr<tbhook::HookManager> manager_;
    std::shared_ptr<tbhook::LedgerRewardToken> reward_token_;
};
