#pragma once

#include <optional>
#include <utility>

namespace tbhook
{

/// Participant in an all-or-nothing execution. The orchestrator opens a
/// checkpoint before the before phase and either commits or rolls back
/// once the after phase has finished. Checkpoints do not nest.
class ITransactional
{
public:
    virtual ~ITransactional() = default;

    virtual void beginCheckpoint() = 0;
    virtual void commitCheckpoint() = 0;
    virtual void rollbackCheckpoint() = 0;
};

/// Live state plus at most one saved copy of it.
template<typename State>
class CheckpointedState
{
public:
    State& get() { return current_; }
    const State& get() const { return current_; }

    void begin() { saved_ = current_; }

    void commit() { saved_.reset(); }

    // No-op without an open checkpoint
    void rollback()
    {
        if (!saved_)
            return;
        current_ = std::move(*saved_);
        saved_.reset();
    }

    bool hasCheckpoint() const { return saved_.has_value(); }

private:
    State current_{};
    std::optional<State> saved_;
};

} // namespace tbhook
