#include "cipherlist/bitset_index.hpp"

#include "cipherlist/algorithm.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace cipherlist {

partition byte_partition(u32 shift) {
    Expects(shift > 0 && shift <= 16);

    const u64 mask = (u64(1) << shift) - 1;

    partition p;
    p.group = [shift](u64 value) { return value >> shift; };
    p.local = [mask](u64 value) { return value & mask; };
    p.block_bits = u32(1) << shift;
    return p;
}

bitset_index::bitset_index(partition p)
    : m_partition(std::move(p))
{
    Expects(m_partition.group);
    Expects(m_partition.local);
    Expects(m_partition.block_bits > 0);
}

bitset_index bitset_index::build(gsl::span<const value_type> values, partition p) {
    bitset_index index(std::move(p));
    for (value_type value : values) {
        index.insert(value);
    }
    return index;
}

void bitset_index::insert(value_type value) {
    const partition& p = m_partition;

    if (p.max_value && value > *p.max_value) {
        throw invalid_domain(fmt::format(
            "Value 0x{:X} is larger than the maximum 0x{:X}", value, *p.max_value));
    }

    const group_type group = p.group(value);
    if (!p.allowed_groups.empty() && !cipherlist::contains(p.allowed_groups, group)) {
        throw unexpected_group(fmt::format(
            "Value 0x{:X} belongs to the unexpected group 0x{:X}", value, group));
    }

    const u64 local = p.local(value);
    if (local >= p.block_bits) {
        throw invalid_domain(fmt::format(
            "Value 0x{:X} maps to bit {} in a block of {} bits", value, local, p.block_bits));
    }

    auto pos = m_blocks.find(group);
    if (pos == m_blocks.end()) {
        pos = m_blocks.emplace(group, block_type(p.block_bits)).first;
    }
    pos->second.set(local);
}

bool bitset_index::contains(value_type value) const {
    if (m_partition.max_value && value > *m_partition.max_value) {
        return false;
    }

    auto pos = m_blocks.find(m_partition.group(value));
    if (pos == m_blocks.end()) {
        return false;
    }

    const u64 local = m_partition.local(value);
    return local < pos->second.size() && pos->second.test(local);
}

std::vector<bitset_index::group_type> bitset_index::groups() const {
    std::vector<group_type> result;
    result.reserve(m_blocks.size());
    for (const auto& entry : m_blocks) {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

const bitset_index::block_type& bitset_index::block(group_type group) const {
    auto pos = m_blocks.find(group);
    Expects(pos != m_blocks.end());
    return pos->second;
}

std::vector<u8> bitset_index::block_bytes(group_type group) const {
    const block_type& bits = block(group);

    std::vector<u8> bytes((bits.size() + 7) / 8, 0);
    for (size_t k = bits.find_first(); k != block_type::npos; k = bits.find_next(k)) {
        bytes[k / 8] |= u8(1) << (k % 8);
    }
    return bytes;
}

} // namespace cipherlist
