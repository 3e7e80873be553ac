#include "loop_device.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include <dirent.h>
#include <linux/loop.h>

#include "base_host.hpp"

namespace {

constexpr const char *kLoopControl = "/dev/loop-control";
constexpr int kOpenRetries = 16;
constexpr int kAttachRetries = 4;
constexpr int kNodeRetries = 40;
constexpr useconds_t kRetryDelayUs = 25000;

std::string device_name(const std::string &path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

int get_free_loop_device() {
    int ctl = xopen(kLoopControl, O_RDWR | O_CLOEXEC);
    if (ctl < 0) {
        return -1;
    }
    owned_fd owned(ctl);
    return xioctl(ctl, LOOP_CTL_GET_FREE, 0, "LOOP_CTL_GET_FREE");
}

int open_loop_node(const std::string &path) {
    int fd, cnt = 0;
    do {
        fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
        if (fd >= 0)
            break;
        /* We have permissions to open /dev/loop-control, but open
         * /dev/loopN failed with EACCES or ENOENT: udevd probably has
         * not created or chowned the node yet. */
        if (errno != EACCES && errno != ENOENT)
            break;
        ::usleep(kRetryDelayUs);
    } while (cnt++ < kOpenRetries);
    if (fd < 0) {
        PLOGE("open %s", path.c_str());
    }
    return fd;
}

// Older kernels lack LOOP_CONFIGURE; fall back to SET_FD + SET_STATUS64.
bool configure_legacy(int loop_fd, int img_fd, const std::string &image) {
    if (xioctl(loop_fd, LOOP_SET_FD, static_cast<unsigned long>(img_fd), "LOOP_SET_FD") < 0) {
        return false;
    }
    struct loop_info64 info{};
    strscpy(reinterpret_cast<char *>(info.lo_file_name), image.c_str(), LO_NAME_SIZE);
    info.lo_flags = LO_FLAGS_PARTSCAN;
    if (::ioctl(loop_fd, LOOP_SET_STATUS64, &info) < 0) {
        PLOGE("ioctl LOOP_SET_STATUS64");
        ::ioctl(loop_fd, LOOP_CLR_FD, 0);
        return false;
    }
    return true;
}

}  // namespace

LoopDevice LoopDevice::attach(const std::string &image) {
    int img_fd = xopen(image.c_str(), O_RDWR | O_CLOEXEC);
    if (img_fd < 0) {
        throw std::runtime_error("cannot open image " + image);
    }
    owned_fd img(img_fd);

    for (int attempt = 0; attempt < kAttachRetries; ++attempt) {
        int nr = get_free_loop_device();
        if (nr < 0) {
            throw std::runtime_error("no free loop device");
        }
        std::string path = "/dev/loop" + std::to_string(nr);
        int loop_fd = open_loop_node(path);
        if (loop_fd < 0) {
            throw std::runtime_error("cannot open " + path);
        }
        owned_fd loop(loop_fd);

        struct loop_config lc{};
        lc.fd = static_cast<__u32>(img_fd);
        strscpy(reinterpret_cast<char *>(lc.info.lo_file_name), image.c_str(), LO_NAME_SIZE);
        lc.info.lo_flags = LO_FLAGS_PARTSCAN;

        if (::ioctl(loop_fd, LOOP_CONFIGURE, &lc) == 0) {
            LOGD("Attached %s to %s\n", image.c_str(), path.c_str());
            return LoopDevice(path);
        }
        if (errno == EBUSY) {
            // Another process grabbed the slot between GET_FREE and CONFIGURE.
            LOGD("%s is busy, retrying\n", path.c_str());
            continue;
        }
        if ((errno == EINVAL || errno == ENOTTY) && configure_legacy(loop_fd, img_fd, image)) {
            return LoopDevice(path);
        }
        PLOGE("ioctl LOOP_CONFIGURE %s", path.c_str());
        throw std::runtime_error("cannot attach " + image + " to " + path);
    }
    throw std::runtime_error("loop devices kept being taken while attaching " + image);
}

bool LoopDevice::find_for_image(const std::string &image, std::string &device) {
    std::string wanted = xrealpath(image.c_str());
    if (wanted.empty()) {
        return false;
    }

    DIR *d = ::opendir("/sys/block");
    if (!d) {
        PLOGE("opendir /sys/block");
        return false;
    }
    std::vector<std::string> matches;
    while (struct dirent *ent = ::readdir(d)) {
        std::string name = ent->d_name;
        if (name.compare(0, 4, "loop") != 0) {
            continue;
        }
        std::string backing;
        std::string attr = "/sys/block/" + name + "/loop/backing_file";
        if (!read_text_file(attr.c_str(), backing)) {
            continue;  // not attached
        }
        if (backing == wanted) {
            matches.push_back("/dev/" + name);
        }
    }
    ::closedir(d);

    if (matches.empty()) {
        return false;
    }
    if (matches.size() > 1) {
        LOGW("%s is attached to %zu loop devices, using %s\n",
             image.c_str(), matches.size(), matches.front().c_str());
    }
    device = matches.front();
    return true;
}

bool LoopDevice::detach(const std::string &device) {
    int fd = xopen(device.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    owned_fd owned(fd);
    return xioctl(fd, LOOP_CLR_FD, 0, "LOOP_CLR_FD") == 0;
}

LoopDevice::LoopDevice(std::string device) : path_(std::move(device)) {}

LoopDevice::LoopDevice(LoopDevice &&other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

LoopDevice::~LoopDevice() {
    if (attached()) {
        LOGI("* Cleaning up from losetup...\n");
        close();
    }
}

bool LoopDevice::close() {
    if (!attached()) {
        return true;
    }
    ::sync();
    bool ok = detach(path_);
    path_.clear();
    return ok;
}

std::string LoopDevice::partition_path(int number) const {
    return path_ + "p" + std::to_string(number);
}

std::vector<std::string> LoopDevice::partition_nodes() const {
    std::vector<std::pair<int, std::string>> found;
    std::string name = device_name(path_);
    std::string sys_dir = "/sys/block/" + name;
    DIR *d = ::opendir(sys_dir.c_str());
    if (!d) {
        PLOGE("opendir %s", sys_dir.c_str());
        return {};
    }
    std::string prefix = name + "p";
    while (struct dirent *ent = ::readdir(d)) {
        std::string part = ent->d_name;
        if (part.size() <= prefix.size() || part.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        int number = std::atoi(part.c_str() + prefix.size());
        if (number > 0) {
            found.emplace_back(number, "/dev/" + part);
        }
    }
    ::closedir(d);

    std::sort(found.begin(), found.end());
    std::vector<std::string> nodes;
    for (auto &[number, node] : found) {
        if (wait_for_partition(number)) {
            nodes.push_back(std::move(node));
        }
    }
    return nodes;
}

bool LoopDevice::wait_for_partition(int number) const {
    std::string node = partition_path(number);
    for (int i = 0; i < kNodeRetries; ++i) {
        if (is_block_device(node.c_str())) {
            return true;
        }
        ::usleep(kRetryDelayUs);
    }
    return false;
}
