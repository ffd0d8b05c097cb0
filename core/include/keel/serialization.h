#pragma once

#include "keycode.h"
#include "state.h"

#include <json-c/json.h>

#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace keel {

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);

// Serialize with recursively sorted object keys (RFC 8785 JCS subset).
void canonical_serialize(json_object* obj, std::ostringstream& out);
std::string canonical_json(json_object* obj); // does not take ownership

// --- Kernel state serialization ---

json_object* keycodes_to_json(const std::vector<Keycode>& kcs);
json_object* module_record_to_json(const ModuleRecord& r);
json_object* policy_record_to_json(const PolicyRecord& r);
json_object* permissions_to_json(const std::set<PermissionKey>& perms);
json_object* kernel_state_to_json(const KernelState& s);

// JSON Pointer segment escaping (RFC 6901): '~' -> "~0", '/' -> "~1".
std::string json_pointer_escape(const std::string& seg);

} // namespace keel
