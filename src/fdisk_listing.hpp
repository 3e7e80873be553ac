#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "partition_table.hpp"

// Adapter over the text printed by `fdisk -l <image>`. Everything that
// depends on the listing layout lives here.

// Partition rows of the listing: `<device> [*] <start> <end> [<sectors>] ...`.
// Headers, warnings and summary lines are skipped.
std::vector<PartitionRecord> scan_partition_rows(std::string_view listing);

// Highest end sector over all rows, or -1 when no row has a numeric end.
std::int64_t scan_last_sector(std::string_view listing);

// N from `Units = sectors of ... = N bytes` (also `Units: ...`).
// When several lines match, the last one wins, even when its value is unusable.
std::optional<std::uint64_t> read_sector_size(std::string_view listing);

// The partition section of the listing, from the `Device` header row to the end.
std::string_view partition_section(std::string_view listing);

// Bytes needed to hold sectors [0, last_sector] of sector_size bytes each.
// Empty for a negative last sector, a non-positive sector size, or when the
// result does not fit in 64 bits.
std::optional<std::uint64_t> minimum_size(std::int64_t last_sector, std::int64_t sector_size);
