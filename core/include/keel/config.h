#pragma once
#include <string>

namespace keel {

enum class Profile { DEV, PROD };

// Detect profile from KEEL_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: no fsync on the event log, upgrades may keep or lower the version
// PROD: fsync each event line, upgrades must raise the module version
void apply_profile_defaults(Profile p);

struct KernelConfig {
    std::string event_log_path;       // KEEL_EVENT_LOG; empty = no file log
    bool event_log_fsync{false};      // KEEL_EVENT_FSYNC
    bool require_version_bump{false}; // KEEL_REQUIRE_VERSION_BUMP
};

// Reads the KEEL_* variables. Call apply_profile_defaults() first to fill gaps.
KernelConfig kernel_config_from_env();

} // namespace keel
