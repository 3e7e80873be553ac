#pragma once

#include <string>
#include <vector>

// Handle to a loop block device backed by an image file.
// The device is detached (after a sync) when the handle goes out of scope,
// unless release() was called to leave it attached for later commands.
class LoopDevice {
public:
    // Attach `image` to a free loop device with partition scanning enabled.
    // Throws std::runtime_error on failure.
    static LoopDevice attach(const std::string &image);

    // Look up the loop device currently backed by `image` through sysfs.
    static bool find_for_image(const std::string &image, std::string &device);

    // Detach an arbitrary loop device. Returns false (after logging) on failure.
    static bool detach(const std::string &device);

    // Adopt an already attached device.
    explicit LoopDevice(std::string device);
    LoopDevice(LoopDevice &&other) noexcept;
    LoopDevice &operator=(LoopDevice &&) = delete;
    LoopDevice(const LoopDevice &) = delete;
    LoopDevice &operator=(const LoopDevice &) = delete;
    ~LoopDevice();

    const std::string &path() const { return path_; }
    bool attached() const { return !path_.empty(); }

    // "/dev/loopN" -> "/dev/loopNpK"
    std::string partition_path(int number) const;

    // Partition nodes the kernel created for this device, ordered by number.
    std::vector<std::string> partition_nodes() const;

    // Wait for udev to create the partition's device node.
    bool wait_for_partition(int number) const;

    // Keep the device attached after this handle is gone.
    void release() { path_.clear(); }

    // Sync and detach now.
    bool close();

private:
    std::string path_;
};
