#include "keel/state.h"
#include "keel/hash.h"
#include "keel/serialization.h"

#include <algorithm>

namespace keel {

const ModuleRecord* KernelState::find_module(const Keycode& kc) const {
    auto it = modules.find(kc);
    if (it == modules.end()) return nullptr;
    return &it->second;
}

const PolicyRecord* KernelState::find_policy(const Address& a) const {
    auto it = policies.find(a);
    if (it == policies.end()) return nullptr;
    return &it->second;
}

bool KernelState::is_policy_active(const Address& a) const {
    const PolicyRecord* r = find_policy(a);
    return r && r->active;
}

bool KernelState::has_permission(const Address& policy, const Keycode& kc, const std::string& fn) const {
    return permissions.count(PermissionKey{policy, kc, fn}) != 0;
}

std::string KernelState::digest() const {
    json_object* o = kernel_state_to_json(*this);
    std::string canon = canonical_json(o);
    json_object_put(o);
    return hash::sha256_hex(canon);
}

} // namespace keel
