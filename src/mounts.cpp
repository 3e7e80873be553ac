#include "mounts.hpp"

#include <cstdlib>
#include <stdexcept>
#include <vector>

#include <mntent.h>
#include <sys/mount.h>

#include "base_host.hpp"
#include "process.hpp"

bool find_mount_point(const std::string &device, std::string &mount_point) {
    FILE *mnt = ::setmntent("/proc/mounts", "r");
    if (!mnt) {
        PLOGE("setmntent /proc/mounts");
        return false;
    }
    bool found = false;
    struct mntent *ent;
    while ((ent = ::getmntent(mnt)) != nullptr) {
        if (device == ent->mnt_fsname) {
            mount_point = ent->mnt_dir;
            found = true;
            break;
        }
    }
    ::endmntent(mnt);
    return found;
}

int mount_partition(const std::string &device, const std::string &mount_point, bool read_only) {
    std::vector<std::string> args{"mount"};
    if (read_only) {
        args.insert(args.end(), {"-o", "ro"});
    }
    args.push_back(device);
    args.push_back(mount_point);
    return exec_command(args);
}

bool unmount(const std::string &mount_point) {
    if (::umount2(mount_point.c_str(), 0) < 0) {
        PLOGE("umount %s", mount_point.c_str());
        return false;
    }
    return true;
}

TempMountPoint::TempMountPoint() {
    const char *tmp = std::getenv("TMPDIR");
    std::string templ = std::string(tmp && *tmp ? tmp : "/tmp") + "/image-tools.XXXXXX";
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        PLOGE("mkdtemp %s", templ.c_str());
        throw std::runtime_error("cannot create a temporary mount point");
    }
    path_ = buf.data();
    LOGD("Created mount point %s\n", path_.c_str());
}

TempMountPoint::~TempMountPoint() {
    if (!path_.empty()) {
        xrmdir(path_.c_str());
    }
}

ScopedMount::ScopedMount(const std::string &device, const std::string &mount_point) {
    LOGI("* Mounting %s on %s...\n", device.c_str(), mount_point.c_str());
    int status = mount_partition(device, mount_point, true);
    if (status != 0) {
        throw std::runtime_error("mount " + device + " exited with status " + std::to_string(status));
    }
    mount_point_ = mount_point;
}

ScopedMount::~ScopedMount() {
    if (!mount_point_.empty()) {
        LOGI("* Unmounting %s...\n", mount_point_.c_str());
        unmount(mount_point_);
    }
}
