#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <unistd.h>

#include "digest.hpp"
#include "partition_table.hpp"

namespace {

constexpr std::uint32_t SECTOR = 512;

struct Image {
    explicit Image(std::size_t sectors) : bytes(sectors * SECTOR, 0) {}

    template <typename T>
    void put(std::uint64_t offset, const T &value) {
        std::memcpy(bytes.data() + offset, &value, sizeof(T));
    }

    template <typename T>
    T get(std::uint64_t offset) const {
        T value{};
        std::memcpy(&value, bytes.data() + offset, sizeof(T));
        return value;
    }

    byte_view view() const { return byte_view(bytes.data(), bytes.size()); }

    std::vector<std::uint8_t> bytes;
};

mbr_entry make_entry(std::uint8_t type, std::uint32_t first, std::uint32_t count) {
    mbr_entry e{};
    e.type = type;
    e.first_lba = first;
    e.sector_count = count;
    return e;
}

void write_mbr(Image &img, std::uint64_t lba, const std::vector<mbr_entry> &entries) {
    mbr_hdr mbr{};
    for (std::size_t i = 0; i < entries.size(); ++i) {
        mbr.entries[i] = entries[i];
    }
    mbr.signature = MBR_SIGNATURE;
    img.put(lba * SECTOR, mbr);
}

// Primary GPT with `parts` at LBA 1, entry array at LBA 2, both checksummed.
void write_gpt(Image &img, const std::vector<std::pair<std::uint64_t, std::uint64_t>> &parts) {
    const std::uint32_t count = 128;
    const std::uint64_t total = img.bytes.size() / SECTOR;
    write_mbr(img, 0, {make_entry(MBR_TYPE_GPT_PROTECTIVE, 1, static_cast<std::uint32_t>(total - 1))});

    for (std::size_t i = 0; i < parts.size(); ++i) {
        gpt_entry e{};
        e.type = {0x0FC63DAF, 0x8483, 0x4772, {0x8E, 0x79, 0x3D, 0x69, 0xD8, 0x47, 0x7D, 0xE4}};
        e.unique.data1 = static_cast<std::uint32_t>(i + 1);
        e.first_lba = parts[i].first;
        e.last_lba = parts[i].second;
        const char *label = "rootfs";
        for (std::size_t c = 0; label[c]; ++c) e.name[2 * c] = static_cast<std::uint8_t>(label[c]);
        img.put(2 * SECTOR + i * sizeof(gpt_entry), e);
    }

    gpt_hdr hdr{};
    std::memcpy(hdr.signature.data(), GPT_SIGNATURE, GPT_SIGNATURE_SIZE);
    hdr.revision = 0x00010000;
    hdr.header_size = sizeof(gpt_hdr);
    hdr.current_lba = 1;
    hdr.backup_lba = total - 1;
    hdr.first_usable_lba = 34;
    hdr.last_usable_lba = total - 34;
    hdr.entries_lba = 2;
    hdr.entry_count = count;
    hdr.entry_size = sizeof(gpt_entry);
    hdr.entries_crc32 = crc32_of(byte_view(img.bytes.data() + 2 * SECTOR, count * sizeof(gpt_entry)));
    hdr.header_crc32 = 0;
    hdr.header_crc32 = crc32_of(byte_view(&hdr, sizeof(hdr)));
    img.put(SECTOR, hdr);
}

}  // namespace

TEST(PartitionTable, NoSignatureIsNone) {
    Image img(8);
    PartitionTable table;
    ASSERT_TRUE(table.load(img.view()));
    EXPECT_EQ(table.scheme(), PartitionScheme::NONE);
    EXPECT_TRUE(table.partitions().empty());
    EXPECT_EQ(table.last_sector(), -1);
}

TEST(PartitionTable, BareFilesystemBootSectorIsNone) {
    Image img(8);
    write_mbr(img, 0, {});
    img.bytes[MBR_TABLE_OFFSET] = 0x3c;  // status byte that no partition entry uses
    PartitionTable table;
    ASSERT_TRUE(table.load(img.view()));
    EXPECT_EQ(table.scheme(), PartitionScheme::NONE);
}

TEST(PartitionTable, PrimaryPartitions) {
    Image img(4096);
    write_mbr(img, 0, {make_entry(0x0c, 8, 1024), make_entry(0x83, 1032, 1016)});
    PartitionTable table;
    ASSERT_TRUE(table.load(img.view()));
    EXPECT_EQ(table.scheme(), PartitionScheme::MBR);
    EXPECT_STREQ(scheme2name(table.scheme()), "dos");
    ASSERT_EQ(table.partitions().size(), 2u);
    EXPECT_EQ(table.partitions()[0].number, 1);
    EXPECT_EQ(table.partitions()[0].type, "0c");
    EXPECT_EQ(table.partitions()[1].start, 1032u);
    EXPECT_EQ(table.partitions()[1].end, 2047u);
    EXPECT_EQ(table.last_sector(), 2047);
}

TEST(PartitionTable, LogicalPartitionsFollowEbrChain) {
    Image img(4096);
    write_mbr(img, 0, {make_entry(0x83, 8, 992), make_entry(0x05, 1000, 3000)});
    // First EBR: logical at +8 for 500 sectors, next EBR at extended+600.
    write_mbr(img, 1000, {make_entry(0x83, 8, 500), make_entry(0x05, 600, 1000)});
    // Second EBR: logical at +8 for 1000 sectors, end of chain.
    write_mbr(img, 1600, {make_entry(0x82, 8, 1000)});

    PartitionTable table;
    ASSERT_TRUE(table.load(img.view()));
    ASSERT_EQ(table.partitions().size(), 4u);
    EXPECT_EQ(table.partitions()[2].number, 5);
    EXPECT_EQ(table.partitions()[2].start, 1008u);
    EXPECT_EQ(table.partitions()[3].number, 6);
    EXPECT_EQ(table.partitions()[3].start, 1608u);
    EXPECT_EQ(table.partitions()[3].end, 2607u);
    EXPECT_EQ(table.partitions()[3].type, "82");
    // The extended container itself reaches further than any logical.
    EXPECT_EQ(table.last_sector(), 3999);
}

TEST(PartitionTable, EbrPastTruncatedImage) {
    Image img(1024);
    write_mbr(img, 0, {make_entry(0x83, 8, 992), make_entry(0x05, 2000, 3000)});
    PartitionTable table;
    ASSERT_TRUE(table.load(img.view()));
    EXPECT_EQ(table.partitions().size(), 2u);
}

TEST(PartitionTable, Gpt) {
    Image img(4096);
    write_gpt(img, {{2048, 3071}, {3072, 4000}});
    PartitionTable table;
    ASSERT_TRUE(table.load(img.view()));
    EXPECT_EQ(table.scheme(), PartitionScheme::GPT);
    EXPECT_EQ(table.sector_size(), 512u);
    EXPECT_EQ(table.backup_lba(), 4095u);
    ASSERT_EQ(table.partitions().size(), 2u);
    EXPECT_EQ(table.partitions()[0].number, 1);
    EXPECT_EQ(table.partitions()[0].sectors, 1024u);
    EXPECT_EQ(table.partitions()[0].name, "rootfs");
    EXPECT_EQ(table.partitions()[0].type, "0FC63DAF-8483-4772-8E79-3D69D8477DE4");
    EXPECT_EQ(table.last_sector(), 4000);
}

TEST(PartitionTable, GptHeaderChecksumMismatch) {
    Image img(4096);
    write_gpt(img, {{2048, 3071}});
    auto hdr = img.get<gpt_hdr>(SECTOR);
    hdr.last_usable_lba += 1;
    img.put(SECTOR, hdr);
    PartitionTable table;
    EXPECT_FALSE(table.load(img.view()));
}

TEST(PartitionTable, GptEntryChecksumMismatch) {
    Image img(4096);
    write_gpt(img, {{2048, 3071}});
    img.bytes[2 * SECTOR + sizeof(gpt_entry) + 40] ^= 0xff;
    PartitionTable table;
    EXPECT_FALSE(table.load(img.view()));
}

TEST(PartitionTable, LoadFromFile) {
    Image img(4096);
    write_mbr(img, 0, {make_entry(0x83, 2048, 2048)});

    char path[] = "/tmp/image-tools-test-XXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(::write(fd, img.bytes.data(), img.bytes.size()),
              static_cast<ssize_t>(img.bytes.size()));
    ::close(fd);

    PartitionTable table;
    EXPECT_TRUE(table.load(std::string(path)));
    EXPECT_EQ(table.last_sector(), 4095);
    ::unlink(path);

    EXPECT_FALSE(table.load(std::string("/nonexistent/image.img")));
}
