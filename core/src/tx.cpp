#include "keel/tx.h"
#include "keel/serialization.h"

#include <json-c/json.h>

#include <stdexcept>
#include <string>

namespace keel {

namespace {

class PatchBuilder {
public:
    PatchBuilder() : arr_(json_object_new_array()) {}
    ~PatchBuilder() { json_object_put(arr_); }

    PatchBuilder(const PatchBuilder&) = delete;
    PatchBuilder& operator=(const PatchBuilder&) = delete;

    void op(const char* name, const std::string& path, json_object* value_or_null) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "op", json_object_new_string(name));
        json_object_object_add(o, "path", json_object_new_string(path.c_str()));
        if (value_or_null) json_object_object_add(o, "value", value_or_null);
        json_object_array_add(arr_, o);
    }

    std::string str() const { return json_object_to_json_string_ext(arr_, JSON_C_TO_STRING_PLAIN); }

private:
    json_object* arr_;
};

// Diff two ordered maps keyed by K, using to_json for values and same() for equality.
template <typename Map, typename KeyFn, typename ToJson, typename Same>
void diff_map(PatchBuilder& pb, const std::string& prefix, const Map& from, const Map& to,
              KeyFn key_str, ToJson to_json, Same same) {
    for (const auto& kv : to) {
        auto it = from.find(kv.first);
        std::string path = prefix + json_pointer_escape(key_str(kv.first));
        if (it == from.end()) {
            pb.op("add", path, to_json(kv.second));
        } else if (!same(it->second, kv.second)) {
            pb.op("replace", path, to_json(kv.second));
        }
    }
    for (const auto& kv : from) {
        if (to.find(kv.first) == to.end()) {
            pb.op("remove", prefix + json_pointer_escape(key_str(kv.first)), nullptr);
        }
    }
}

std::string permission_path(const PermissionKey& p) {
    return "/permissions/" + p.policy.toString() + "/" + p.keycode.toString() + "/" +
           json_pointer_escape(p.function);
}

std::string compute_patch_json(const KernelState& from, const KernelState& to) {
    PatchBuilder pb;

    diff_map(pb, "/modules/", from.modules, to.modules,
             [](const Keycode& k) { return k.toString(); },
             [](const ModuleRecord& r) { return module_record_to_json(r); },
             [](const ModuleRecord& a, const ModuleRecord& b) {
                 return a.address == b.address && a.version == b.version;
             });

    diff_map(pb, "/policies/", from.policies, to.policies,
             [](const Address& a) { return a.toString(); },
             [](const PolicyRecord& r) { return policy_record_to_json(r); },
             [](const PolicyRecord& a, const PolicyRecord& b) {
                 return a.active == b.active && a.epoch == b.epoch && a.dependencies == b.dependencies;
             });

    for (const auto& p : to.permissions) {
        if (!from.permissions.count(p)) pb.op("add", permission_path(p), json_object_new_boolean(1));
    }
    for (const auto& p : from.permissions) {
        if (!to.permissions.count(p)) pb.op("remove", permission_path(p), nullptr);
    }

    diff_map(pb, "/dependents/", from.dependents, to.dependents,
             [](const Keycode& k) { return k.toString(); },
             [](const std::vector<Address>& v) {
                 json_object* arr = json_object_new_array();
                 for (const auto& a : v) json_object_array_add(arr, json_object_new_string(a.toString().c_str()));
                 return arr;
             },
             [](const std::vector<Address>& a, const std::vector<Address>& b) { return a == b; });

    if (from.executor != to.executor) {
        pb.op("replace", "/executor", json_object_new_string(to.executor.toString().c_str()));
    }

    return pb.str();
}

} // namespace

StateTx::StateTx(KernelState& live) : live_(live), base_(live), active_(true) {}

StateTx::~StateTx() {
    if (active_) rollback();
}

void StateTx::commit() {
    if (!active_) throw std::logic_error("state tx not active");
    patch_json_ = compute_patch_json(base_, live_);
    active_ = false;
}

void StateTx::rollback() {
    if (!active_) return;
    live_ = base_;
    active_ = false;
}

} // namespace keel
