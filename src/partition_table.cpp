#include "partition_table.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

#include "digest.hpp"

namespace {

constexpr std::uint32_t kProbeSectorSizes[] = {512, 4096};
constexpr int kMaxLogicalPartitions = 128;
constexpr std::uint32_t kMaxGptEntries = 1024;

bool is_extended(std::uint8_t type) {
    return type == 0x05 || type == 0x0F || type == 0x85;
}

template <typename T>
bool read_at(byte_view image, std::uint64_t offset, T &out) {
    if (offset > image.size() || image.size() - offset < sizeof(T)) {
        return false;
    }
    std::memcpy(&out, image.data() + offset, sizeof(T));
    return true;
}

std::string mbr_type_str(std::uint8_t type) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02x", type);
    return buf;
}

std::string gpt_name_str(const std::array<uint8_t, GPT_NAME_UNITS * 2> &name) {
    std::string out;
    for (std::size_t i = 0; i + 1 < name.size(); i += 2) {
        uint16_t unit = static_cast<uint16_t>(name[i] | (name[i + 1] << 8));
        if (unit == 0) break;
        out.push_back(unit < 0x80 ? static_cast<char>(unit) : '?');
    }
    return out;
}

bool guid_is_zero(const gpt_guid &guid) {
    static const gpt_guid zero{};
    return std::memcmp(&guid, &zero, sizeof(gpt_guid)) == 0;
}

}  // namespace

const char *scheme2name(PartitionScheme scheme) {
    switch (scheme) {
        case PartitionScheme::MBR: return "dos";
        case PartitionScheme::GPT: return "gpt";
        case PartitionScheme::NONE:
        default:
            return "none";
    }
}

std::string guid2str(const gpt_guid &guid) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08X-%04X-%04X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                  guid.data1, guid.data2, guid.data3,
                  guid.data4[0], guid.data4[1], guid.data4[2], guid.data4[3],
                  guid.data4[4], guid.data4[5], guid.data4[6], guid.data4[7]);
    return buf;
}

bool PartitionTable::load(const std::string &image) {
    mmap_data map(image.c_str());
    if (map.data() == nullptr) {
        if (map.size() == 0 && is_regular_file(image.c_str())) {
            // Empty file: nothing to parse.
            scheme_ = PartitionScheme::NONE;
            partitions_.clear();
            return true;
        }
        LOGE("Cannot map image %s\n", image.c_str());
        return false;
    }
    return load(map.view());
}

bool PartitionTable::load(byte_view image) {
    scheme_ = PartitionScheme::NONE;
    sector_size_ = 512;
    backup_lba_ = 0;
    partitions_.clear();

    mbr_hdr mbr{};
    if (!read_at(image, 0, mbr) || mbr.signature != MBR_SIGNATURE) {
        LOGD("No MBR signature found\n");
        return true;
    }
    for (const auto &e : mbr.entries) {
        // A boot sector of a bare filesystem also carries 0xAA55; reject it.
        if (e.status != 0x00 && e.status != 0x80) {
            LOGD("Boot sector without a partition table\n");
            return true;
        }
    }

    bool protective = std::any_of(mbr.entries.begin(), mbr.entries.end(),
                                  [](const mbr_entry &e) { return e.type == MBR_TYPE_GPT_PROTECTIVE; });
    if (protective) {
        for (std::uint32_t ss : kProbeSectorSizes) {
            gpt_hdr hdr{};
            if (read_at(image, ss, hdr) &&
                std::memcmp(hdr.signature.data(), GPT_SIGNATURE, GPT_SIGNATURE_SIZE) == 0) {
                return parse_gpt(image, ss);
            }
        }
        LOGW("Protective MBR without a GPT header\n");
    }
    return parse_mbr(image, mbr);
}

bool PartitionTable::parse_mbr(byte_view image, const mbr_hdr &mbr) {
    scheme_ = PartitionScheme::MBR;
    sector_size_ = 512;

    std::uint64_t extended_start = 0;
    for (std::size_t i = 0; i < mbr.entries.size(); ++i) {
        const mbr_entry &e = mbr.entries[i];
        if (e.type == MBR_TYPE_EMPTY || e.sector_count == 0) {
            continue;
        }
        PartitionRecord rec;
        rec.number = static_cast<int>(i + 1);
        rec.start = e.first_lba;
        rec.sectors = e.sector_count;
        rec.end = rec.start + rec.sectors - 1;
        rec.type = mbr_type_str(e.type);
        partitions_.push_back(rec);
        if (is_extended(e.type) && extended_start == 0) {
            extended_start = e.first_lba;
        }
    }

    if (extended_start != 0) {
        return parse_ebr_chain(image, extended_start);
    }
    return true;
}

bool PartitionTable::parse_ebr_chain(byte_view image, std::uint64_t extended_start) {
    std::uint64_t ebr_lba = extended_start;
    for (int n = 0; n < kMaxLogicalPartitions; ++n) {
        mbr_hdr ebr{};
        if (!read_at(image, ebr_lba * sector_size_, ebr)) {
            // The chain points past a truncated image.
            LOGW("EBR at sector %llu lies beyond the end of the image\n",
                 static_cast<unsigned long long>(ebr_lba));
            return true;
        }
        if (ebr.signature != MBR_SIGNATURE) {
            LOGE("Invalid EBR signature at sector %llu\n", static_cast<unsigned long long>(ebr_lba));
            return false;
        }

        const mbr_entry &logical = ebr.entries[0];
        if (logical.type != MBR_TYPE_EMPTY && logical.sector_count != 0) {
            PartitionRecord rec;
            rec.number = 5 + n;
            rec.start = ebr_lba + logical.first_lba;
            rec.sectors = logical.sector_count;
            rec.end = rec.start + rec.sectors - 1;
            rec.type = mbr_type_str(logical.type);
            partitions_.push_back(rec);
        }

        const mbr_entry &next = ebr.entries[1];
        if (!is_extended(next.type) || next.first_lba == 0) {
            return true;
        }
        ebr_lba = extended_start + next.first_lba;
    }
    LOGE("EBR chain longer than %d entries\n", kMaxLogicalPartitions);
    return false;
}

bool PartitionTable::parse_gpt(byte_view image, std::uint32_t sector_size) {
    gpt_hdr hdr{};
    if (!read_at(image, sector_size, hdr)) {
        return false;
    }

    if (hdr.header_size < sizeof(gpt_hdr) || hdr.header_size > sector_size ||
        image.size() - sector_size < hdr.header_size) {
        LOGE("Invalid GPT header size %u\n", hdr.header_size);
        return false;
    }
    std::vector<std::uint8_t> raw(image.data() + sector_size,
                                  image.data() + sector_size + hdr.header_size);
    std::memset(raw.data() + offsetof(gpt_hdr, header_crc32), 0, sizeof(uint32_t));
    if (crc32_of(byte_view(raw.data(), raw.size())) != hdr.header_crc32) {
        LOGE("GPT header checksum mismatch\n");
        return false;
    }

    if (hdr.entry_size < sizeof(gpt_entry) || hdr.entry_count > kMaxGptEntries) {
        LOGE("Unsupported GPT entry array (%u x %u bytes)\n", hdr.entry_count, hdr.entry_size);
        return false;
    }
    std::uint64_t array_off = hdr.entries_lba * sector_size;
    std::uint64_t array_len = static_cast<std::uint64_t>(hdr.entry_count) * hdr.entry_size;
    if (array_off > image.size() || image.size() - array_off < array_len) {
        LOGE("GPT entry array lies beyond the end of the image\n");
        return false;
    }
    if (crc32_of(byte_view(image.data() + array_off, array_len)) != hdr.entries_crc32) {
        LOGE("GPT entry array checksum mismatch\n");
        return false;
    }

    scheme_ = PartitionScheme::GPT;
    sector_size_ = sector_size;
    backup_lba_ = hdr.backup_lba;

    for (std::uint32_t i = 0; i < hdr.entry_count; ++i) {
        gpt_entry e{};
        if (!read_at(image, array_off + static_cast<std::uint64_t>(i) * hdr.entry_size, e) ||
            guid_is_zero(e.type)) {
            continue;
        }
        if (e.last_lba < e.first_lba) {
            LOGE("GPT entry %u ends before it starts\n", i + 1);
            return false;
        }
        PartitionRecord rec;
        rec.number = static_cast<int>(i + 1);
        rec.start = e.first_lba;
        rec.end = e.last_lba;
        rec.sectors = e.last_lba - e.first_lba + 1;
        rec.type = guid2str(e.type);
        rec.name = gpt_name_str(e.name);
        partitions_.push_back(rec);
    }
    return true;
}

std::int64_t PartitionTable::last_sector() const {
    std::int64_t last = -1;
    for (const auto &p : partitions_) {
        last = std::max(last, static_cast<std::int64_t>(p.end));
    }
    return last;
}
