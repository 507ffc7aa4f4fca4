#pragma once

#include "Address.hpp"
#include "Types.hpp"

namespace tbhook
{

/// Snapshot of one execution, passed to both phases.
/// `success` and `returnData` are only meaningful in the after phase.
struct HookParams
{
    TokenId tokenId = 0;
    Address account;   // executing token-bound account
    Address caller;    // who requested the execution
    Address to;        // call target
    Amount value = 0;  // native currency attached
    Selector selector{};
    Bytes hookData;    // full call payload

    bool success = false;
    Bytes returnData;
};

} // namespace tbhook
