#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "base_host.hpp"

/******************
 * On-disk layouts
 *****************/

constexpr std::size_t MBR_SIZE = 512;
constexpr std::size_t MBR_TABLE_OFFSET = 446;
constexpr std::uint16_t MBR_SIGNATURE = 0xAA55;

constexpr std::uint8_t MBR_TYPE_EMPTY = 0x00;
constexpr std::uint8_t MBR_TYPE_GPT_PROTECTIVE = 0xEE;

struct mbr_entry {
    uint8_t status;                /* 0x80 = bootable */
    std::array<uint8_t, 3> first_chs;
    uint8_t type;
    std::array<uint8_t, 3> last_chs;
    uint32_t first_lba;
    uint32_t sector_count;
} __attribute__((packed));

struct mbr_hdr {
    std::array<uint8_t, MBR_TABLE_OFFSET> boot_code;
    std::array<mbr_entry, 4> entries;
    uint16_t signature;            /* 0xAA55 */
} __attribute__((packed));

static_assert(sizeof(mbr_entry) == 16, "invalid MBR entry size");
static_assert(sizeof(mbr_hdr) == MBR_SIZE, "invalid MBR size");

constexpr std::size_t GPT_SIGNATURE_SIZE = 8;
constexpr char GPT_SIGNATURE[GPT_SIGNATURE_SIZE + 1] = "EFI PART";
constexpr std::size_t GPT_NAME_UNITS = 36;

struct gpt_guid {
    uint32_t data1;
    uint16_t data2;
    uint16_t data3;
    std::array<uint8_t, 8> data4;
} __attribute__((packed));

struct gpt_hdr {
    std::array<char, GPT_SIGNATURE_SIZE> signature;
    uint32_t revision;
    uint32_t header_size;
    uint32_t header_crc32;         /* computed with this field zeroed */
    uint32_t reserved;
    uint64_t current_lba;
    uint64_t backup_lba;
    uint64_t first_usable_lba;
    uint64_t last_usable_lba;
    gpt_guid disk_guid;
    uint64_t entries_lba;
    uint32_t entry_count;
    uint32_t entry_size;
    uint32_t entries_crc32;
} __attribute__((packed));

struct gpt_entry {
    gpt_guid type;
    gpt_guid unique;
    uint64_t first_lba;
    uint64_t last_lba;             /* inclusive */
    uint64_t attributes;
    std::array<uint8_t, GPT_NAME_UNITS * 2> name;  /* UTF-16LE */
} __attribute__((packed));

static_assert(sizeof(gpt_hdr) == 92, "invalid GPT header size");
static_assert(sizeof(gpt_entry) == 128, "invalid GPT entry size");

/*********************
 * Parsed partitions
 *********************/

// One partition as seen by either the native reader or the fdisk listing
// scanner. Sector numbers are zero-based and `end` is inclusive.
struct PartitionRecord {
    int number = 0;
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t sectors = 0;
    std::string type;
    std::string name;
};

enum class PartitionScheme {
    NONE,
    MBR,
    GPT,
};

const char *scheme2name(PartitionScheme scheme);

std::string guid2str(const gpt_guid &guid);

// Native MBR/GPT reader over an image file. Extended MBR partitions are
// followed through their EBR chain; logical partitions are numbered from 5.
class PartitionTable {
public:
    // Returns false when the image can't be read or a table is corrupt.
    // An image without any recognizable table loads as PartitionScheme::NONE.
    bool load(const std::string &image);
    bool load(byte_view image);

    PartitionScheme scheme() const { return scheme_; }
    std::uint32_t sector_size() const { return sector_size_; }
    const std::vector<PartitionRecord> &partitions() const { return partitions_; }

    // Highest inclusive end sector over all partitions, -1 when there are none.
    [[nodiscard]] std::int64_t last_sector() const;

    // GPT only: the backup header location recorded by the primary header.
    std::uint64_t backup_lba() const { return backup_lba_; }

private:
    bool parse_mbr(byte_view image, const mbr_hdr &mbr);
    bool parse_ebr_chain(byte_view image, std::uint64_t extended_start);
    bool parse_gpt(byte_view image, std::uint32_t sector_size);

    PartitionScheme scheme_ = PartitionScheme::NONE;
    std::uint32_t sector_size_ = 512;
    std::uint64_t backup_lba_ = 0;
    std::vector<PartitionRecord> partitions_;
};
