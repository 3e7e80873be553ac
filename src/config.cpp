#include "config.hpp"

#include <cstdlib>
#include <string_view>

#include "base_host.hpp"

using namespace std::literals;

static bool check_env(const char *name) {
    const char *val = getenv(name);
    return val != nullptr && val == "true"sv;
}

static void env_override(const char *name, std::string &value) {
    const char *val = getenv(name);
    if (val != nullptr && *val != '\0') {
        value = val;
    }
}

Config load_config() {
    Config cfg;
    env_override("EDITOR", cfg.editor);
    env_override("IMAGE_TOOLS_PARTITION_EDITOR", cfg.partition_editor);
    env_override("IMAGE_TOOLS_FDISK", cfg.fdisk);
    cfg.skip_confirmation = check_env("IMAGE_TOOLS_RTFM") || ::access(RTFM_MARKER, F_OK) == 0;
    LOGD("config: editor=%s partition_editor=%s fdisk=%s skip_confirmation=%d\n",
         cfg.editor.c_str(), cfg.partition_editor.c_str(), cfg.fdisk.c_str(),
         cfg.skip_confirmation);
    return cfg;
}
