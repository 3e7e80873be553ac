#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

// Host-side base utilities shared by every image-tools command.

// Logging helpers: route everything to stderr.
inline void LOGD(const char *fmt, ...) {
#ifdef NDEBUG
    (void)fmt;
#else
    va_list ap;
    va_start(ap, fmt);
    vfprintf(stderr, fmt, ap);
    va_end(ap);
#endif
}

inline void LOGI(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vfprintf(stderr, fmt, ap);
    va_end(ap);
}

inline void LOGW(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    std::fputs("WARNING: ", stderr);
    vfprintf(stderr, fmt, ap);
    va_end(ap);
}

inline void LOGE(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    std::fputs("ERROR: ", stderr);
    vfprintf(stderr, fmt, ap);
    va_end(ap);
}

#define PLOGE(fmt, args...) \
    LOGE(fmt " failed with %d: %s\n", ##args, errno, std::strerror(errno))

extern "C" {

// xwraps: thin error-logging wrappers around POSIX APIs.

inline int xopen(const char *pathname, int flags, mode_t mode = 0) {
    int fd = ::open(pathname, flags, mode);
    if (fd < 0) PLOGE("open %s", pathname ? pathname : "(null)");
    return fd;
}

inline int xioctl(int fd, unsigned long request, unsigned long arg, const char *what) {
    int r = ::ioctl(fd, request, arg);
    if (r < 0) PLOGE("ioctl %s", what);
    return r;
}

inline int xtruncate(const char *pathname, off_t length) {
    int r = ::truncate(pathname, length);
    if (r < 0) PLOGE("truncate %s", pathname ? pathname : "(null)");
    return r;
}

inline int xrmdir(const char *pathname) {
    int r = ::rmdir(pathname);
    if (r < 0) PLOGE("rmdir %s", pathname ? pathname : "(null)");
    return r;
}

} // extern "C"

// strscpy: truncating copy, returns bytes written
inline std::size_t strscpy(char *dest, const char *src, std::size_t size) {
    if (size == 0) return 0;
    std::size_t i = 0;
    while (i < size - 1 && src[i]) {
        dest[i] = src[i];
        ++i;
    }
    dest[i] = '\0';
    return i;
}

// File type probes; errors other than ENOENT are logged.
bool is_regular_file(const char *path);
bool is_directory(const char *path);
bool is_block_device(const char *path);

// Canonical absolute path, or an empty string when it cannot be resolved.
std::string xrealpath(const char *path);

// Read a small text file (sysfs attribute) with its trailing newline removed.
bool read_text_file(const char *path, std::string &out);

// byte_view / byte_data: non-owning views over raw memory.
struct byte_view {
    byte_view() : ptr(nullptr), sz(0) {}
    byte_view(const void *buf, std::size_t sz) : ptr(static_cast<const std::uint8_t *>(buf)), sz(sz) {}
    byte_view(std::string_view s) : byte_view(s.data(), s.size()) {}

    const std::uint8_t *data() const { return ptr; }
    std::size_t size() const { return sz; }

private:
    const std::uint8_t *ptr;
    std::size_t sz;
};

struct byte_data {
    byte_data() : ptr(nullptr), sz(0) {}
    byte_data(void *buf, std::size_t sz) : ptr(static_cast<std::uint8_t *>(buf)), sz(sz) {}

    std::uint8_t *data() const { return ptr; }
    std::size_t size() const { return sz; }

private:
    std::uint8_t *ptr;
    std::size_t sz;
};

// mmap-backed read-only mapping.
struct mmap_data : public byte_data {
    mmap_data() = default;
    explicit mmap_data(const char *name);
    ~mmap_data();

    mmap_data(const mmap_data &) = delete;
    mmap_data &operator=(const mmap_data &) = delete;

    byte_view view() const { return byte_view(data(), size()); }

private:
    void *addr = nullptr;
    std::size_t len = 0;
};

// RAII fd wrapper.
struct owned_fd {
    owned_fd() : fd(-1) {}
    explicit owned_fd(int fd) : fd(fd) {}
    ~owned_fd() { if (fd >= 0) ::close(fd); }

    owned_fd(const owned_fd &) = delete;
    owned_fd &operator=(const owned_fd &) = delete;

    operator int() const { return fd; }
    int release() { int old = fd; fd = -1; return old; }

private:
    int fd;
};
