#pragma once

#include <cstdint>
#include <string>

#include "base_host.hpp"

constexpr std::size_t SHA256_DIGEST_SIZE = 32;

// Incremental SHA-256 backed by OpenSSL.
class SHA {
public:
    SHA();
    ~SHA();

    SHA(const SHA &) = delete;
    SHA &operator=(const SHA &) = delete;

    void update(byte_view data);
    // Writes SHA256_DIGEST_SIZE bytes; the context can't be updated afterwards.
    void finalize_into(byte_data out);

private:
    void *ctx_;
};

// Lowercase hex SHA-256 of a file's contents, streamed in fixed-size chunks.
// Returns false (after logging) when the file cannot be read.
bool sha256_file(const char *path, std::string &hex_out);

std::string to_hex(byte_view data);

// zlib CRC-32 (IEEE 802.3), as used by GPT headers and entry arrays.
std::uint32_t crc32_of(byte_view data);
