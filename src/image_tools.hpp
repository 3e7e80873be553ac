#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

#define IMAGE_TOOLS_VERSION "0"

#define RETURN_OK     0
#define RETURN_ERROR  1
#define RETURN_USAGE  2

using Args = std::vector<std::string>;

// Entries of the command table: argument validation runs first, then the
// privilege check, the dependency check and the confirmation gate.
struct Command {
    const char *name;
    const char *synopsis;
    const char *summary;
    bool needs_root;
    bool needs_confirmation;
    bool (*validate)(const Args &args);
    Args (*dependencies)(const Config &cfg, const Args &args);
    int (*run)(const Config &cfg, const Args &args);
};

const std::vector<Command> &command_table();

int cmd_partitions(const Config &cfg, const Args &args);
int cmd_losetup(const Config &cfg, const Args &args);
int cmd_mount(const Config &cfg, const Args &args);
int cmd_umount(const Config &cfg, const Args &args);
int cmd_shrink(const Config &cfg, const Args &args);
int cmd_fsck(const Config &cfg, const Args &args);
int cmd_compare_fs(const Config &cfg, const Args &args);
int cmd_compare_img(const Config &cfg, const Args &args);

// Positive decimal partition number, 0 when invalid.
int parse_partition_no(const std::string &arg);

// Set the image file's length to exactly `size` bytes.
bool truncate_image(const std::string &image, std::uint64_t size);

// Outcome of reading the listings taken before and after the partition editor ran.
struct ShrinkPlan {
    std::uint64_t sector_size = 0;
    std::int64_t last_sector = -1;
    std::uint64_t new_size = 0;
};

// Sector size of the listing taken before editing. Logs and returns false
// when it is missing, zero, or too large for the size calculation.
bool shrink_sector_size(std::string_view before, std::uint64_t &sector_size);

// Sector size from `before`, last partition sector from `after`, and the
// image size they require. Logs the reason and returns false on failure.
bool plan_shrink(std::string_view before, std::string_view after, ShrinkPlan &plan);

// Source file shown to users who decline the second prompt: the installed
// copy, or this build's own source when running uninstalled.
std::string rtfm_source_path();

// The two "do you know what you are doing" prompts, answered from `in`.
// Returns false when the user declines; declining the second prompt opens
// rtfm_source_path() in $EDITOR.
bool confirm_rtfm(const Config &cfg, FILE *in = stdin);

void print_usage(const char *prog);

// Entry point when linked into another binary; the standalone build
// defines main() on top of it.
int image_tools_main(int argc, char **argv);
