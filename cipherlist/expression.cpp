#include "cipherlist/expression.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace cipherlist {

std::string hex(u64 value) {
    std::string digits = fmt::format("{:X}", value);
    if (digits.size() % 2 != 0) {
        digits.insert(digits.begin(), '0');
    }
    return "0x" + digits;
}

bool operator==(const term& a, const term& b) {
    return a.kind == b.kind && a.low == b.low && a.high == b.high && a.joined == b.joined;
}

bool operator!=(const term& a, const term& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& o, const term& t) {
    switch (t.kind) {
    case term::equal:
        return o << "id == " << hex(t.low);
    case term::range:
        return o << "(" << hex(t.low) << " <= id && id <= " << hex(t.high) << ")";
    }
    unreachable("invalid term kind");
}

std::vector<term> to_terms(const std::vector<interval<u64>>& intervals, u64 range_threshold) {
    std::vector<term> result;
    for (const interval<u64>& i : intervals) {
        if (i.end() - i.begin() < range_threshold) {
            for (u64 v = i.begin(); ; ++v) {
                result.push_back(term{term::equal, v, v, v != i.begin()});
                if (v == i.end()) {
                    break;
                }
            }
        } else {
            result.push_back(term{term::range, i.begin(), i.end(), false});
        }
    }
    return result;
}

bool evaluate(const std::vector<term>& terms, u64 id) {
    return std::any_of(terms.begin(), terms.end(), [&](const term& t) {
        return t.matches(id);
    });
}

std::string render_condition(const std::vector<term>& terms) {
    if (terms.empty()) {
        return "(0)";
    }

    fmt::memory_buffer out;
    u32 on_line = 0; // ids written on the current line
    bool first = true;
    for (const term& t : terms) {
        if (t.joined && !first) {
            fmt::format_to(std::back_inserter(out), " || ");
        } else {
            fmt::format_to(std::back_inserter(out), "{}", first ? "( \\\n " : " ||");
            if (on_line >= 3) {
                on_line = 0;
                fmt::format_to(std::back_inserter(out), " \\\n ");
            }
            fmt::format_to(std::back_inserter(out), " ");
        }
        first = false;

        switch (t.kind) {
        case term::equal:
            fmt::format_to(std::back_inserter(out), "id == {}", hex(t.low));
            break;
        case term::range:
            fmt::format_to(std::back_inserter(out), "({} <= id && id <= {})", hex(t.low), hex(t.high));
            break;
        }
        on_line += t.weight();
    }
    fmt::format_to(std::back_inserter(out), " \\\n)");
    return fmt::to_string(out);
}

namespace {

/// Renders the first and last id of a block.
/// Whole hex digits are appended to the group key if the block size allows it,
/// which keeps the group visible in the output (`0xC000`, `0xC0FF`).
std::pair<std::string, std::string> block_bounds(u64 group, u32 shift) {
    const u64 first = group << shift;
    const u64 last = first + ((u64(1) << shift) - 1);
    if (shift % 4 == 0) {
        const u32 digits = shift / 4;
        return {
            fmt::format("{}{:0{}X}", hex(group), u64(0), digits),
            fmt::format("{}{:0{}X}", hex(group), last - first, digits)
        };
    }
    return {hex(first), hex(last)};
}

} // namespace

std::string render_lookup_condition(const bitset_index& index, u32 shift) {
    Expects(shift > 0 && shift <= 16);
    Expects(index.block_bits() == (u32(1) << shift));

    if (index.group_count() == 0) {
        return "(0)";
    }

    constexpr size_t bytes_per_line = 16;

    fmt::memory_buffer out;
    bool first = true;
    for (u64 group : index.groups()) {
        fmt::format_to(std::back_inserter(out), "{} \\\n", first ? "(" : " ||");
        first = false;

        const auto bounds = block_bounds(group, shift);
        fmt::format_to(std::back_inserter(out), "  ({} <= id && id <= {} && \\\n",
                       bounds.first, bounds.second);

        const std::vector<u8> bytes = index.block_bytes(group);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i % bytes_per_line == 0) {
                fmt::format_to(std::back_inserter(out), "    \"");
            }
            fmt::format_to(std::back_inserter(out), "\\x{:02X}", bytes[i]);
            if (i % bytes_per_line == bytes_per_line - 1 || i + 1 == bytes.size()) {
                fmt::format_to(std::back_inserter(out), "\" \\\n");
            }
        }

        fmt::format_to(std::back_inserter(out), "    [(id & {}) / 8] & (1 << (id % 8)))",
                       hex(index.block_bits() - 1));
    }
    fmt::format_to(std::back_inserter(out), " \\\n)");
    return fmt::to_string(out);
}

std::string render_switch_cases(gsl::span<const u64> ids) {
    constexpr u32 cases_per_line = 5;

    fmt::memory_buffer out;
    u32 on_line = 0;
    for (u64 id : ids) {
        if (on_line >= cases_per_line) {
            fmt::format_to(std::back_inserter(out), "\n");
            on_line = 0;
        }
        if (on_line == 0) {
            fmt::format_to(std::back_inserter(out), " ");
        }
        fmt::format_to(std::back_inserter(out), " case {}:", hex(id));
        ++on_line;
    }
    return fmt::to_string(out);
}

} // namespace cipherlist
