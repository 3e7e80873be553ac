#include "base_host.hpp"

#include <climits>
#include <fstream>

static bool stat_mode(const char *path, mode_t &mode) {
    if (!path || !*path) return false;
    struct stat st{};
    if (::stat(path, &st) < 0) {
        if (errno != ENOENT && errno != ENOTDIR) PLOGE("stat %s", path);
        return false;
    }
    mode = st.st_mode;
    return true;
}

bool is_regular_file(const char *path) {
    mode_t mode = 0;
    return stat_mode(path, mode) && S_ISREG(mode);
}

bool is_directory(const char *path) {
    mode_t mode = 0;
    return stat_mode(path, mode) && S_ISDIR(mode);
}

bool is_block_device(const char *path) {
    mode_t mode = 0;
    return stat_mode(path, mode) && S_ISBLK(mode);
}

std::string xrealpath(const char *path) {
    char buf[PATH_MAX];
    if (!::realpath(path, buf)) {
        PLOGE("realpath %s", path ? path : "(null)");
        return {};
    }
    return buf;
}

bool read_text_file(const char *path, std::string &out) {
    std::ifstream ifs(path);
    if (!ifs) return false;
    std::getline(ifs, out);
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' || out.back() == ' '))
        out.pop_back();
    return true;
}

mmap_data::mmap_data(const char *name) {
    int fd = xopen(name, O_RDONLY | O_CLOEXEC);
    if (fd < 0) return;
    owned_fd owned(fd);
    struct stat st{};
    if (fstat(fd, &st) < 0) {
        PLOGE("fstat %s", name ? name : "(null)");
        return;
    }
    len = static_cast<std::size_t>(st.st_size);
    if (len == 0) return;
    addr = ::mmap(nullptr, len, PROT_READ, MAP_SHARED, fd, 0);
    if (addr == MAP_FAILED) {
        PLOGE("mmap %s", name ? name : "(null)");
        addr = nullptr;
        len = 0;
        return;
    }
    *static_cast<byte_data *>(this) = byte_data(addr, len);
}

mmap_data::~mmap_data() {
    if (addr && len) {
        ::munmap(addr, len);
    }
}
