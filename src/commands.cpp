#include <climits>
#include <cstdio>
#include <stdexcept>

#include "base_host.hpp"
#include "fdisk_listing.hpp"
#include "image_tools.hpp"
#include "loop_device.hpp"
#include "mounts.hpp"
#include "partition_table.hpp"
#include "process.hpp"
#include "tree_compare.hpp"

#ifndef IMAGE_TOOLS_SOURCE
#define IMAGE_TOOLS_SOURCE __FILE__
#endif

namespace {

/*****************
 * Validation
 *****************/

bool has_image(const Args &args, std::size_t idx) {
    return args.size() > idx && is_regular_file(args[idx].c_str());
}

bool has_partition(const Args &args, std::size_t idx) {
    return args.size() > idx && parse_partition_no(args[idx]) > 0;
}

bool validate_image(const Args &args) {
    return has_image(args, 0);
}

bool validate_mount(const Args &args) {
    return has_image(args, 0) && has_partition(args, 1) &&
           args.size() > 2 && is_directory(args[2].c_str());
}

bool validate_umount(const Args &args) {
    return has_image(args, 0) && has_partition(args, 1);
}

bool validate_fsck(const Args &args) {
    return has_image(args, 0) && (args.size() < 2 || has_partition(args, 1));
}

bool validate_compare_fs(const Args &args) {
    if (!has_image(args, 0) || !has_partition(args, 1) || args.size() < 3 || args[2].empty()) {
        return false;
    }
    return is_remote_path(args[2]) || is_directory(args[2].c_str());
}

bool validate_compare_img(const Args &args) {
    return has_image(args, 0) && has_partition(args, 1) &&
           has_image(args, 2) && has_partition(args, 3);
}

/*****************
 * Dependencies
 *****************/

Args deps_none(const Config &, const Args &) {
    return {};
}

Args deps_partitions(const Config &cfg, const Args &) {
    return {cfg.fdisk};
}

Args deps_mount(const Config &, const Args &) {
    return {"mount"};
}

Args deps_shrink(const Config &cfg, const Args &) {
    return {cfg.fdisk, cfg.partition_editor};
}

Args deps_fsck(const Config &, const Args &) {
    return {"fsck"};
}

Args deps_compare_fs(const Config &, const Args &args) {
    if (args.size() > 2 && is_remote_path(args[2])) {
        return {"mount", "rsync"};
    }
    return {"mount"};
}

/*****************
 * Helpers
 *****************/

bool read_listing(const Config &cfg, const std::string &image, std::string &listing) {
    int status = capture_command({cfg.fdisk, "-l", image}, listing);
    if (status != 0) {
        LOGE("%s -l %s exited with status %d\n", cfg.fdisk.c_str(), image.c_str(), status);
        return false;
    }
    return true;
}

// Node of partition `number` on an attached device, once udev has created it.
bool partition_node(const LoopDevice &loop, int number, std::string &node) {
    node = loop.partition_path(number);
    if (!loop.wait_for_partition(number)) {
        LOGE("No such partition: %s\n", node.c_str());
        return false;
    }
    return true;
}

void report_partitions(const LoopDevice &loop) {
    auto nodes = loop.partition_nodes();
    std::string list;
    for (const auto &n : nodes) {
        if (!list.empty()) list += ' ';
        list += n;
    }
    LOGI("* Partitions found: %s\n", list.empty() ? "None" : list.c_str());
}

// The primary GPT header records where its backup lives; truncation cuts it off.
void check_native_table(const std::string &image, std::int64_t listed_last,
                        std::uint64_t sector_size, std::uint64_t new_size) {
    PartitionTable table;
    if (!table.load(image)) {
        LOGW("Could not read the partition table of %s natively\n", image.c_str());
        return;
    }
    LOGD("native table: %s, %zu partitions\n", scheme2name(table.scheme()),
         table.partitions().size());
    if (table.sector_size() == sector_size && table.last_sector() != listed_last) {
        LOGW("Partition table ends at sector %lld, the listing reported %lld\n",
             static_cast<long long>(table.last_sector()), static_cast<long long>(listed_last));
    }
    if (table.scheme() == PartitionScheme::GPT &&
        table.backup_lba() >= new_size / table.sector_size()) {
        LOGW("The backup GPT header (sector %llu) lies past the new end of the image; "
             "rebuild it with 'sgdisk -e'\n",
             static_cast<unsigned long long>(table.backup_lba()));
    }
}

int read_answer(const char *prompt, FILE *in) {
    std::fputs(prompt, stderr);
    std::fflush(stderr);
    char line[64];
    if (!std::fgets(line, sizeof(line), in)) {
        std::fputc('\n', stderr);
        return EOF;
    }
    return static_cast<unsigned char>(line[0]);
}

}  // namespace

int parse_partition_no(const std::string &arg) {
    if (arg.empty() || arg.size() > 6) return 0;
    int n = 0;
    for (char c : arg) {
        if (c < '0' || c > '9') return 0;
        n = n * 10 + (c - '0');
    }
    return n;
}

bool truncate_image(const std::string &image, std::uint64_t size) {
    if (size > static_cast<std::uint64_t>(LLONG_MAX)) {
        LOGE("Size %llu does not fit in a file offset\n", static_cast<unsigned long long>(size));
        return false;
    }
    return xtruncate(image.c_str(), static_cast<off_t>(size)) == 0;
}

bool shrink_sector_size(std::string_view before, std::uint64_t &sector_size) {
    auto size = read_sector_size(before);
    if (!size || *size == 0 || *size > static_cast<std::uint64_t>(INT64_MAX)) {
        LOGE("Could not calculate image sector size.\n");
        return false;
    }
    sector_size = *size;
    return true;
}

bool plan_shrink(std::string_view before, std::string_view after, ShrinkPlan &plan) {
    if (!shrink_sector_size(before, plan.sector_size)) {
        return false;
    }
    plan.last_sector = scan_last_sector(after);
    if (plan.last_sector <= 0) {
        LOGE("Could not find last partition sector end (%lld).\n",
             static_cast<long long>(plan.last_sector));
        return false;
    }
    auto new_size = minimum_size(plan.last_sector, static_cast<std::int64_t>(plan.sector_size));
    if (!new_size || *new_size == 0) {
        LOGE("Could not calculate new size.\n");
        return false;
    }
    plan.new_size = *new_size;
    return true;
}

/*****************
 * Commands
 *****************/

int cmd_partitions(const Config &cfg, const Args &args) {
    std::string listing;
    if (!read_listing(cfg, args[0], listing)) {
        return RETURN_ERROR;
    }
    std::string_view rows = partition_section(listing);
    if (rows.empty()) {
        LOGI("No partitions found in %s\n", args[0].c_str());
        return RETURN_OK;
    }
    std::fwrite(rows.data(), 1, rows.size(), stdout);
    return RETURN_OK;
}

int cmd_losetup(const Config &, const Args &args) {
    const std::string &image = args[0];
    LoopDevice loop = LoopDevice::attach(image);
    LOGI("* Set up \"%s\" on %s\n", image.c_str(), loop.path().c_str());
    report_partitions(loop);
    std::printf("%s\n", loop.path().c_str());
    loop.release();
    return RETURN_OK;
}

int cmd_mount(const Config &, const Args &args) {
    const std::string &image = args[0];
    const int number = parse_partition_no(args[1]);
    const std::string &mount_point = args[2];

    LoopDevice loop = LoopDevice::attach(image);
    LOGI("* Set up \"%s\" on %s\n", image.c_str(), loop.path().c_str());

    std::string node;
    if (!partition_node(loop, number, node)) {
        return RETURN_USAGE;
    }
    LOGI("* Mounting %s on %s...\n", node.c_str(), mount_point.c_str());
    int status = mount_partition(node, mount_point, false);
    if (status != 0) {
        throw std::runtime_error("mount " + node + " exited with status " + std::to_string(status));
    }
    loop.release();
    return RETURN_OK;
}

int cmd_umount(const Config &, const Args &args) {
    const std::string &image = args[0];
    const int number = parse_partition_no(args[1]);

    std::string device;
    if (!LoopDevice::find_for_image(image, device)) {
        LOGE("No loop device is associated with %s\n", image.c_str());
        return RETURN_ERROR;
    }
    LoopDevice loop(device);
    std::string node = loop.partition_path(number);

    std::string mount_point;
    if (find_mount_point(node, mount_point)) {
        LOGI("* Unmounting %s from %s...\n", node.c_str(), mount_point.c_str());
        if (!unmount(mount_point)) {
            loop.release();
            return RETURN_ERROR;
        }
    } else {
        LOGW("%s is not mounted\n", node.c_str());
    }

    for (const auto &other : loop.partition_nodes()) {
        if (find_mount_point(other, mount_point)) {
            LOGI("* %s is still mounted on %s, keeping %s\n",
                 other.c_str(), mount_point.c_str(), device.c_str());
            loop.release();
            return RETURN_OK;
        }
    }
    return loop.close() ? RETURN_OK : RETURN_ERROR;
}

int cmd_shrink(const Config &cfg, const Args &args) {
    const std::string &image = args[0];

    LOGI("* Calculating sector size...\n");
    std::string before;
    std::uint64_t sector_size = 0;
    if (!read_listing(cfg, image, before) || !shrink_sector_size(before, sector_size)) {
        return RETURN_ERROR;
    }
    LOGI("    Sector size: %llu bytes.\n", static_cast<unsigned long long>(sector_size));

    LoopDevice loop = LoopDevice::attach(image);
    LOGI("* Set up \"%s\" on %s\n", image.c_str(), loop.path().c_str());

    LOGI("* Starting %s...\n", cfg.partition_editor.c_str());
    int status = exec_command({cfg.partition_editor, loop.path()});
    if (status != 0) {
        LOGE("%s exited with status %d\n", cfg.partition_editor.c_str(), status);
        return RETURN_ERROR;
    }
    ::sync();

    LOGI("* Calculating new image size...\n");
    std::string after;
    ShrinkPlan plan;
    if (!read_listing(cfg, image, after) || !plan_shrink(before, after, plan)) {
        return RETURN_ERROR;
    }

    LOGI("    Sector size: %llu (bytes)\n", static_cast<unsigned long long>(plan.sector_size));
    LOGI("    Last partition end: %lld (sectors)\n", static_cast<long long>(plan.last_sector));
    LOGI("    New size: %llu (bytes)\n", static_cast<unsigned long long>(plan.new_size));
    check_native_table(image, plan.last_sector, plan.sector_size, plan.new_size);

    LOGI("* Resizing image...\n");
    if (!truncate_image(image, plan.new_size)) {
        return RETURN_ERROR;
    }
    return RETURN_OK;
}

int cmd_fsck(const Config &, const Args &args) {
    const std::string &image = args[0];
    LoopDevice loop = LoopDevice::attach(image);
    LOGI("* Set up \"%s\" on %s\n", image.c_str(), loop.path().c_str());

    std::vector<std::string> targets;
    if (args.size() > 1) {
        std::string node;
        if (!partition_node(loop, parse_partition_no(args[1]), node)) {
            return RETURN_USAGE;
        }
        targets.push_back(node);
    } else {
        targets = loop.partition_nodes();
        if (targets.empty()) {
            targets.push_back(loop.path());
        }
    }

    bool failed = false;
    for (const auto &target : targets) {
        LOGI("* Running file system check on %s...\n", target.c_str());
        int status = exec_command({"fsck", target});
        // 1 and 2 mean errors were corrected; 4 and up mean they were not.
        if (status >= 4) {
            LOGE("fsck %s exited with status %d\n", target.c_str(), status);
            failed = true;
        }
    }
    return failed ? RETURN_ERROR : RETURN_OK;
}

int cmd_compare_fs(const Config &, const Args &args) {
    const std::string &image = args[0];
    const std::string &dst = args[2];

    LoopDevice loop = LoopDevice::attach(image);
    std::string node;
    if (!partition_node(loop, parse_partition_no(args[1]), node)) {
        return RETURN_USAGE;
    }
    TempMountPoint mount_point;
    ScopedMount mounted(node, mount_point.path());

    if (is_remote_path(dst)) {
        return compare_remote(mount_point.path(), dst);
    }
    return compare_directories(mount_point.path(), dst);
}

int cmd_compare_img(const Config &, const Args &args) {
    LoopDevice src_loop = LoopDevice::attach(args[0]);
    LoopDevice dst_loop = LoopDevice::attach(args[2]);

    std::string src_node, dst_node;
    if (!partition_node(src_loop, parse_partition_no(args[1]), src_node) ||
        !partition_node(dst_loop, parse_partition_no(args[3]), dst_node)) {
        return RETURN_USAGE;
    }
    TempMountPoint src_dir;
    TempMountPoint dst_dir;
    ScopedMount src_mount(src_node, src_dir.path());
    ScopedMount dst_mount(dst_node, dst_dir.path());

    return compare_directories(src_dir.path(), dst_dir.path());
}

/*****************
 * Gate
 *****************/

std::string rtfm_source_path() {
    if (is_regular_file(IMAGE_TOOLS_SOURCE)) {
        return IMAGE_TOOLS_SOURCE;
    }
    return __FILE__;
}

bool confirm_rtfm(const Config &cfg, FILE *in) {
    if (cfg.skip_confirmation) {
        return true;
    }
    int answer = read_answer("WARNING: Do you know what you are doing? [yN]: ", in);
    if (answer != 'y' && answer != 'Y') {
        return false;
    }
    answer = read_answer("WARNING: Are you really sure? Type 'N' to see the source code "
                         "and learn what you are doing! [yN]: ", in);
    if (answer != 'y' && answer != 'Y') {
        // $EDITOR may carry its own arguments ("code -w"); let the shell split it.
        int status = exec_command({"/bin/sh", "-c", cfg.editor + " \"$1\"", "sh", rtfm_source_path()});
        if (status != 0) {
            LOGW("%s exited with status %d\n", cfg.editor.c_str(), status);
        }
        return false;
    }
    return true;
}

const std::vector<Command> &command_table() {
    static const std::vector<Command> table = {
        {"partitions", "<IMAGE>",
         "List partitions contained in image.",
         false, false, validate_image, deps_partitions, cmd_partitions},
        {"losetup", "<IMAGE>",
         "Sets up an image file on a loopback device.",
         true, true, validate_image, deps_none, cmd_losetup},
        {"mount", "<IMAGE> <PARTITION_NO> <MOUNT_POINT>",
         "Mounts the selected partition from an image file.",
         true, true, validate_mount, deps_mount, cmd_mount},
        {"umount", "<IMAGE> <PARTITION_NO>",
         "Unmounts the selected partition and releases the loopback device.",
         true, false, validate_umount, deps_none, cmd_umount},
        {"fsck", "<IMAGE> [PARTITION_NO]",
         "Run file system check on one or all partitions in image.",
         true, true, validate_fsck, deps_fsck, cmd_fsck},
        {"shrink", "<IMAGE>",
         "Graphically edit partitions then shrink image file.",
         true, true, validate_image, deps_shrink, cmd_shrink},
        {"compare-fs", "<IMAGE> <PARTITION_NO> <DST>",
         "Compare a partition with a local directory or a remote host:path (dry run).",
         true, false, validate_compare_fs, deps_compare_fs, cmd_compare_fs},
        {"compare-img", "<SRC_IMAGE> <SRC_PARTITION_NO> <DST_IMAGE> <DST_PARTITION_NO>",
         "Compare partitions of two images (dry run).",
         true, false, validate_compare_img, deps_mount, cmd_compare_img},
    };
    return table;
}
