#pragma once
#include "keycode.h"
#include "types.h"

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace keel {

class Module;
class Policy;

struct ModuleRecord {
    Keycode keycode;
    Address address;
    Version version;
    std::shared_ptr<Module> module;
};

struct PolicyRecord {
    Address address;
    bool active{false};
    std::vector<Keycode> dependencies; // captured at last (re)activation or upgrade refresh
    uint64_t epoch{0};                 // activation epoch backing the issued Capability
    std::shared_ptr<Policy> policy;
};

// One granted (policy, keycode, entry-point) triple. Absent = not granted.
struct PermissionKey {
    Address policy;
    Keycode keycode;
    std::string function;

    bool operator<(const PermissionKey& o) const {
        return std::tie(policy, keycode, function) < std::tie(o.policy, o.keycode, o.function);
    }
    bool operator==(const PermissionKey& o) const {
        return policy == o.policy && keycode == o.keycode && function == o.function;
    }
};

// Everything the kernel owns. Ordered containers keep snapshots and
// digests deterministic.
struct KernelState {
    std::map<Keycode, ModuleRecord> modules;
    std::unordered_map<Address, Keycode> module_keycodes; // module address -> keycode
    std::map<Address, PolicyRecord> policies;
    std::set<PermissionKey> permissions;
    std::map<Keycode, std::vector<Address>> dependents;   // keycode -> active dependent policies
    Address executor;

    const ModuleRecord* find_module(const Keycode& kc) const;
    const PolicyRecord* find_policy(const Address& a) const;
    bool is_policy_active(const Address& a) const;
    bool has_permission(const Address& policy, const Keycode& kc, const std::string& fn) const;

    // Deterministic digest over the whole state (SHA-256 of the canonical snapshot).
    std::string digest() const;
};

} // namespace keel
