#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <zlib.h>
#include <openssl/sha.h>

#include "base_host.hpp"
#include "digest.hpp"

// ===========================
// SHA-256 via OpenSSL
// ===========================

SHA::SHA() : ctx_(new SHA256_CTX) {
    SHA256_Init(static_cast<SHA256_CTX *>(ctx_));
}

SHA::~SHA() {
    delete static_cast<SHA256_CTX *>(ctx_);
}

void SHA::update(byte_view data) {
    if (!ctx_) return;
    SHA256_Update(static_cast<SHA256_CTX *>(ctx_), data.data(), data.size());
}

void SHA::finalize_into(byte_data out) {
    if (!ctx_) return;
    if (out.size() < SHA256_DIGEST_SIZE) {
        throw std::length_error("SHA output buffer too small");
    }
    auto *c = static_cast<SHA256_CTX *>(ctx_);
    SHA256_Final(out.data(), c);
    delete c;
    ctx_ = nullptr;
}

bool sha256_file(const char *path, std::string &hex_out) {
    int fd = xopen(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    owned_fd owned(fd);

    SHA ctx;
    std::array<std::uint8_t, 64 * 1024> buf{};
    for (;;) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            PLOGE("read %s", path);
            return false;
        }
        if (n == 0) break;
        ctx.update(byte_view(buf.data(), static_cast<std::size_t>(n)));
    }

    std::array<std::uint8_t, SHA256_DIGEST_SIZE> digest{};
    ctx.finalize_into(byte_data(digest.data(), digest.size()));
    hex_out = to_hex(byte_view(digest.data(), digest.size()));
    return true;
}

std::string to_hex(byte_view data) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::size_t i = 0; i < data.size(); ++i) {
        out.push_back(kDigits[data.data()[i] >> 4]);
        out.push_back(kDigits[data.data()[i] & 0xf]);
    }
    return out;
}

// ===========================
// CRC-32 via zlib
// ===========================

std::uint32_t crc32_of(byte_view data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    const Bytef *p = reinterpret_cast<const Bytef *>(data.data());
    std::size_t remaining = data.size();
    // zlib takes uInt lengths; feed large buffers in pieces.
    while (remaining > 0) {
        uInt chunk = static_cast<uInt>(remaining > 0x40000000U ? 0x40000000U : remaining);
        crc = crc32(crc, p, chunk);
        p += chunk;
        remaining -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}
