#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

#include <unistd.h>

#include "base_host.hpp"
#include "image_tools.hpp"
#include "process.hpp"

void print_usage(const char *prog) {
    std::fprintf(stderr,
                 "\n"
                 "image-tools v" IMAGE_TOOLS_VERSION "\n"
                 "\n"
                 "Utility for managing raw disk images produced by 'dd' and other tools.\n"
                 "\n"
                 "Usage: %s <command>\n"
                 "\n"
                 "Available commands:\n",
                 prog);
    for (const auto &cmd : command_table()) {
        std::fprintf(stderr, "  %-11s %s\n    %s\n\n", cmd.name, cmd.synopsis, cmd.summary);
    }
}

static bool check_dependencies(const Args &deps) {
    bool ok = true;
    for (const auto &dep : deps) {
        if (!find_executable(dep)) {
            LOGE("Missing dependency: %s\n", dep.c_str());
            ok = false;
        }
    }
    return ok;
}

static const Command *find_command(const char *name) {
    for (const auto &cmd : command_table()) {
        if (std::strcmp(cmd.name, name) == 0) {
            return &cmd;
        }
    }
    return nullptr;
}

// Entry point when linked into another binary. Standalone build defines main() below.
int image_tools_main(int argc, char **argv) {
    const char *prog = argc > 0 ? argv[0] : "image-tools";
    if (argc < 2) {
        print_usage(prog);
        return RETURN_OK;
    }

    std::string name = argv[1];
    if (name == "version" || name == "--version") {
        std::printf("image-tools v%s\n", IMAGE_TOOLS_VERSION);
        return RETURN_OK;
    }
    const Command *cmd = find_command(argv[1]);
    if (cmd == nullptr) {
        if (name != "help" && name != "--help" && name != "-h") {
            LOGW("Unknown command: %s\n", name.c_str());
        }
        print_usage(prog);
        return RETURN_OK;
    }

    Args args(argv + 2, argv + argc);
    if (!cmd->validate(args)) {
        LOGE("Invalid arguments. Usage: %s %s %s\n", prog, cmd->name, cmd->synopsis);
        return RETURN_USAGE;
    }

    try {
        Config cfg = load_config();
        if (cmd->needs_root && ::geteuid() != 0) {
            LOGE("Must run as root.\n");
            return RETURN_USAGE;
        }
        if (!check_dependencies(cmd->dependencies(cfg, args))) {
            return RETURN_ERROR;
        }
        if (cmd->needs_confirmation && !confirm_rtfm(cfg)) {
            return RETURN_ERROR;
        }
        return cmd->run(cfg, args);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "image-tools error: %s\n", e.what());
        return RETURN_ERROR;
    }
}

#if defined(IMAGE_TOOLS_STANDALONE)
int main(int argc, char **argv) {
    return image_tools_main(argc, argv);
}
#endif
