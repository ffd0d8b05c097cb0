#pragma once
#include "state.h"

#include <string>

namespace keel {

// StateTx: stages an administrative action on the live KernelState.
// The action mutates the live state in place so that hooks called mid-action
// observe it; if the StateTx is destroyed without commit(), the live state is
// restored to the snapshot taken at construction.
// Non-copyable/non-movable: it is bound to one action on one kernel.
class StateTx {
public:
    explicit StateTx(KernelState& live);
    ~StateTx();

    StateTx(const StateTx&) = delete;
    StateTx& operator=(const StateTx&) = delete;
    StateTx(StateTx&&) = delete;
    StateTx& operator=(StateTx&&) = delete;

    const KernelState& base() const { return base_; }
    bool active() const { return active_; }

    void commit();
    void rollback();

    // RFC6902-like patch describing changes from base -> live (computed on commit)
    const std::string& patch_json() const { return patch_json_; }

private:
    KernelState& live_;
    KernelState base_;
    bool active_{true};
    std::string patch_json_{};
};

} // namespace keel
