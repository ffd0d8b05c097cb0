#include "keel/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace keel {

Profile detect_profile() {
    const char* env = std::getenv("KEEL_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must run before any other thread reads the environment.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("KEEL_EVENT_FSYNC",          "0", NO_OVERWRITE);
            setenv("KEEL_REQUIRE_VERSION_BUMP", "0", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("KEEL_EVENT_FSYNC",          "1", NO_OVERWRITE);
            setenv("KEEL_REQUIRE_VERSION_BUMP", "1", NO_OVERWRITE);
            break;
    }
}

static bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    return v && std::string(v) == "1";
}

KernelConfig kernel_config_from_env() {
    KernelConfig cfg;
    if (const char* p = std::getenv("KEEL_EVENT_LOG")) cfg.event_log_path = p;
    cfg.event_log_fsync = env_flag("KEEL_EVENT_FSYNC");
    cfg.require_version_bump = env_flag("KEEL_REQUIRE_VERSION_BUMP");
    return cfg;
}

} // namespace keel
