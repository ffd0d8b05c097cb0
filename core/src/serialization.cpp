#include "keel/serialization.h"

#include <algorithm>
#include <map>

namespace keel {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = json_object_get_string(v);
    return true;
}

void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        int len = (int)json_object_array_length(obj);
        for (int i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

std::string json_pointer_escape(const std::string& seg) {
    std::string out;
    out.reserve(seg.size());
    for (char c : seg) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out.push_back(c);
    }
    return out;
}

// --- Kernel state serialization ---

json_object* keycodes_to_json(const std::vector<Keycode>& kcs) {
    json_object* arr = json_object_new_array();
    for (const auto& kc : kcs) {
        json_object_array_add(arr, json_object_new_string(kc.toString().c_str()));
    }
    return arr;
}

json_object* module_record_to_json(const ModuleRecord& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "keycode", json_object_new_string(r.keycode.toString().c_str()));
    json_object_object_add(o, "address", json_object_new_string(r.address.toString().c_str()));
    json_object_object_add(o, "version", json_object_new_string(r.version.toString().c_str()));
    return o;
}

json_object* policy_record_to_json(const PolicyRecord& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "address", json_object_new_string(r.address.toString().c_str()));
    json_object_object_add(o, "active", json_object_new_boolean(r.active ? 1 : 0));
    json_object_object_add(o, "dependencies", keycodes_to_json(r.dependencies));
    json_object_object_add(o, "epoch", json_object_new_int64((int64_t)r.epoch));
    return o;
}

json_object* permissions_to_json(const std::set<PermissionKey>& perms) {
    // { "<policy>": { "<KEYCODE>": ["fn", ...] } }
    json_object* root = json_object_new_object();
    std::map<std::string, std::map<std::string, std::vector<std::string>>> grouped;
    for (const auto& p : perms) {
        grouped[p.policy.toString()][p.keycode.toString()].push_back(p.function);
    }
    for (const auto& pol : grouped) {
        json_object* by_kc = json_object_new_object();
        for (const auto& kc : pol.second) {
            json_object* fns = json_object_new_array();
            for (const auto& fn : kc.second) json_object_array_add(fns, json_object_new_string(fn.c_str()));
            json_object_object_add(by_kc, kc.first.c_str(), fns);
        }
        json_object_object_add(root, pol.first.c_str(), by_kc);
    }
    return root;
}

json_object* kernel_state_to_json(const KernelState& s) {
    json_object* root = json_object_new_object();

    json_object* modules = json_object_new_object();
    for (const auto& kv : s.modules) {
        json_object_object_add(modules, kv.first.toString().c_str(), module_record_to_json(kv.second));
    }
    json_object_object_add(root, "modules", modules);

    json_object* policies = json_object_new_object();
    for (const auto& kv : s.policies) {
        json_object_object_add(policies, kv.first.toString().c_str(), policy_record_to_json(kv.second));
    }
    json_object_object_add(root, "policies", policies);

    json_object_object_add(root, "permissions", permissions_to_json(s.permissions));

    json_object* deps = json_object_new_object();
    for (const auto& kv : s.dependents) {
        json_object* arr = json_object_new_array();
        for (const auto& a : kv.second) json_object_array_add(arr, json_object_new_string(a.toString().c_str()));
        json_object_object_add(deps, kv.first.toString().c_str(), arr);
    }
    json_object_object_add(root, "dependents", deps);

    json_object_object_add(root, "executor", json_object_new_string(s.executor.toString().c_str()));
    return root;
}

} // namespace keel
