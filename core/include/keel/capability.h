#pragma once
#include "keycode.h"
#include "types.h"

#include <cstdint>
#include <string>

namespace keel {

class Kernel;

// A (keycode, entry-point) pair a policy asks to be allowed to call.
struct Permission {
    Keycode keycode;
    std::string function;
};

// Capability: proof of policy identity issued by a kernel at activation.
// Only a Kernel can mint one. It is valid for permission checks while the
// policy stays active in that same activation (epoch) on that same kernel.
class Capability {
public:
    Capability() = default; // null capability; never permitted

    const Address& policy() const { return policy_; }
    uint64_t epoch() const { return epoch_; }
    const Kernel* issuer() const { return issuer_; }
    bool is_null() const { return issuer_ == nullptr; }

private:
    friend class Kernel;
    Capability(const Address& policy, uint64_t epoch, const Kernel* issuer)
        : policy_(policy), epoch_(epoch), issuer_(issuer) {}

    Address policy_;
    uint64_t epoch_{0};
    const Kernel* issuer_{nullptr};
};

} // namespace keel
