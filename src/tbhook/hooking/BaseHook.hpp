#pragma once

#include "HookCreateInfo.hpp"
#include "../core/HookEvents.hpp"
#include "../core/IHook.hpp"

namespace tbhook
{

/**
 * @brief Shared scaffolding for hooks
 *
 * Both phases check the invoker against the bound authority before any
 * hook-specific logic runs. Phases that are not overridden fail with
 * NotImplemented so a hook that declares a phase it never implemented
 * cannot pass silently.
 */
class BaseHook : public IHook
{
public:
    explicit BaseHook(const HookCreateInfo& create_info);
    ~BaseHook() override = default;

    BaseHook(const BaseHook&) = delete;
    BaseHook& operator=(const BaseHook&) = delete;

    HookResult beforeExecute(const Address& invoker, const HookParams& params) final;
    HookResult afterExecute(const Address& invoker, const HookParams& params) final;

    const Address& authority() const { return authority_; }
    HookEventEmitter& events() { return events_; }

    virtual const char* hookName() const { return "hook"; }

protected:
    virtual HookResult handleBeforeExecute(const HookParams& params);
    virtual HookResult handleAfterExecute(const HookParams& params);

    Timestamp now() const { return time_source_(); }
    bool verbose() const { return verbose_; }
    void emit(const HookEvent& event) const { events_.emit(event); }

private:
    bool isAuthorized(const Address& invoker, HookPhase phase) const;

    Address authority_;
    TimeSource time_source_;
    bool verbose_;
    HookEventEmitter events_;
};

} // namespace tbhook
