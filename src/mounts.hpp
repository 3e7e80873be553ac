#pragma once

#include <string>

// First mount point of `device` listed in /proc/mounts.
bool find_mount_point(const std::string &device, std::string &mount_point);

// Mount through mount(8) so the filesystem type is auto-detected.
// Returns mount's exit status.
int mount_partition(const std::string &device, const std::string &mount_point, bool read_only);

// umount2(2); returns false (after logging) on failure.
bool unmount(const std::string &mount_point);

// Private directory under $TMPDIR (or /tmp) removed when the object dies.
class TempMountPoint {
public:
    TempMountPoint();
    ~TempMountPoint();

    TempMountPoint(const TempMountPoint &) = delete;
    TempMountPoint &operator=(const TempMountPoint &) = delete;

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

// A read-only mount that is unmounted when the object dies.
// Throws std::runtime_error when mounting fails.
class ScopedMount {
public:
    ScopedMount(const std::string &device, const std::string &mount_point);
    ~ScopedMount();

    ScopedMount(const ScopedMount &) = delete;
    ScopedMount &operator=(const ScopedMount &) = delete;

private:
    std::string mount_point_;
};
