#include "fdisk_listing.hpp"

#include <algorithm>
#include <charconv>
#include <string>

namespace {

std::vector<std::string_view> split_ws(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r')) {
            ++pos;
        }
        std::size_t begin = pos;
        while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t' && line[pos] != '\r') {
            ++pos;
        }
        if (pos > begin) {
            out.push_back(line.substr(begin, pos - begin));
        }
    }
    return out;
}

// Pure non-negative decimal integer; anything else (signs, units, overflow) is rejected.
std::optional<std::uint64_t> parse_u64(std::string_view s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

int trailing_number(std::string_view device) {
    std::size_t i = device.size();
    while (i > 0 && device[i - 1] >= '0' && device[i - 1] <= '9') {
        --i;
    }
    auto n = parse_u64(device.substr(i));
    return n && *n < 1000000 ? static_cast<int>(*n) : 0;
}

template <typename Fn>
void for_each_line(std::string_view text, Fn &&fn) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        fn(text.substr(pos, eol - pos), pos);
        pos = eol + 1;
    }
}

}  // namespace

std::vector<PartitionRecord> scan_partition_rows(std::string_view listing) {
    std::vector<PartitionRecord> rows;
    for_each_line(listing, [&rows](std::string_view line, std::size_t) {
        auto tokens = split_ws(line);
        if (tokens.size() < 3 || tokens[0].back() == ':' || tokens[0] == "Device") {
            return;
        }
        std::size_t idx = tokens[1] == "*" ? 2 : 1;
        if (tokens.size() < idx + 2) {
            return;
        }
        auto start = parse_u64(tokens[idx]);
        auto end = parse_u64(tokens[idx + 1]);
        if (!start || !end) {
            return;
        }
        PartitionRecord rec;
        rec.number = trailing_number(tokens[0]);
        rec.start = *start;
        rec.end = *end;
        auto sectors = tokens.size() > idx + 2 ? parse_u64(tokens[idx + 2]) : std::nullopt;
        rec.sectors = sectors ? *sectors : (rec.end >= rec.start ? rec.end - rec.start + 1 : 0);
        rec.name = std::string(tokens[0]);
        rows.push_back(std::move(rec));
    });
    return rows;
}

std::int64_t scan_last_sector(std::string_view listing) {
    std::int64_t last = -1;
    for (const auto &row : scan_partition_rows(listing)) {
        if (row.end > static_cast<std::uint64_t>(INT64_MAX)) {
            continue;
        }
        last = std::max(last, static_cast<std::int64_t>(row.end));
    }
    return last;
}

std::optional<std::uint64_t> read_sector_size(std::string_view listing) {
    static constexpr std::string_view kPrefixes[] = {"Units = sectors of ", "Units: sectors of "};
    static constexpr std::string_view kSuffix = " bytes";

    std::optional<std::uint64_t> found;
    for_each_line(listing, [&found](std::string_view line, std::size_t) {
        std::size_t at = std::string_view::npos;
        for (auto prefix : kPrefixes) {
            at = line.find(prefix);
            if (at != std::string_view::npos) {
                at += prefix.size();
                break;
            }
        }
        if (at == std::string_view::npos) {
            return;
        }
        found.reset();
        std::string_view rest = line.substr(at);
        while (!rest.empty() && (rest.back() == '\r' || rest.back() == ' ')) {
            rest.remove_suffix(1);
        }
        std::size_t eq = rest.rfind(" = ");
        if (eq == std::string_view::npos || rest.size() < kSuffix.size() ||
            rest.substr(rest.size() - kSuffix.size()) != kSuffix) {
            return;
        }
        std::size_t value_at = eq + 3;
        std::size_t value_end = rest.size() - kSuffix.size();
        if (value_end < value_at) {
            return;
        }
        found = parse_u64(rest.substr(value_at, value_end - value_at));
    });
    return found;
}

std::string_view partition_section(std::string_view listing) {
    std::string_view section;
    for_each_line(listing, [&](std::string_view line, std::size_t offset) {
        if (!section.empty()) {
            return;
        }
        // Older fdisk indents the header row.
        auto tokens = split_ws(line);
        if (!tokens.empty() && tokens[0] == "Device") {
            section = listing.substr(offset);
        }
    });
    return section;
}

std::optional<std::uint64_t> minimum_size(std::int64_t last_sector, std::int64_t sector_size) {
    if (last_sector < 0 || sector_size <= 0) {
        return std::nullopt;
    }
    std::uint64_t bytes = 0;
    if (__builtin_mul_overflow(static_cast<std::uint64_t>(last_sector) + 1,
                               static_cast<std::uint64_t>(sector_size), &bytes)) {
        return std::nullopt;
    }
    return bytes;
}
