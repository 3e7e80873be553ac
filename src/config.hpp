#pragma once

#include <string>

// Marker file in the working directory that disables the confirmation prompts.
constexpr const char *RTFM_MARKER = ".rtfm";

// Settings read from the environment once per invocation.
struct Config {
    std::string editor = "vi";              // EDITOR
    std::string partition_editor = "gparted";  // IMAGE_TOOLS_PARTITION_EDITOR
    std::string fdisk = "fdisk";            // IMAGE_TOOLS_FDISK
    bool skip_confirmation = false;         // IMAGE_TOOLS_RTFM=true or ./.rtfm
};

Config load_config();
