#pragma once

#include "Address.hpp"
#include "HookParams.hpp"
#include "HookResult.hpp"
#include "PermissionSet.hpp"

namespace tbhook
{

class ITransactional;

/**
 * @brief Capability interface every hook implements
 *
 * Implementing IHook directly leaves it to the author to keep
 * permissions() consistent with the phases that do real work. The
 * BeforeOnlyHook / AfterOnlyHook / FullHook wrappers pin that down at
 * compile time.
 */
class IHook
{
public:
    virtual ~IHook() = default;

    /// Pure query, callable by anyone.
    virtual PermissionSet permissions() const = 0;

    /**
     * @brief Runs before the target call
     * @param invoker Identity of the party invoking the hook; must be the bound orchestrator
     * @return kHookMagic on success; a failure aborts the operation before the target call
     */
    virtual HookResult beforeExecute(const Address& invoker, const HookParams& params) = 0;

    /**
     * @brief Runs after the target call with success/returnData filled in
     * @return kHookMagic on success; a failure rolls back the whole operation
     */
    virtual HookResult afterExecute(const Address& invoker, const HookParams& params) = 0;

    /// Rollback participant for hooks that own mutable state, or nullptr.
    virtual ITransactional* transactional() { return nullptr; }
};

} // namespace tbhook
