#ifndef CIPHERLIST_BITSET_INDEX_HPP
#define CIPHERLIST_BITSET_INDEX_HPP

#include "cipherlist/common.hpp"

#include <boost/dynamic_bitset.hpp>
#include <boost/optional.hpp>
#include <gsl/span>

#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

/// \file
/// Contains a membership index made of fixed-size bit vectors,
/// one per group of values.

namespace cipherlist {

/// Base class of all errors raised while building a \ref bitset_index.
class index_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// A value is larger than the configured maximum or maps to a bit
/// outside of its block.
class invalid_domain : public index_error {
public:
    using index_error::index_error;
};

/// A value belongs to a group that is not on the allow-list.
class unexpected_group : public index_error {
public:
    using index_error::index_error;
};

/// Describes how values are split into a group key and a bit position
/// within that group's block, together with the checks applied to every
/// value during construction.
struct partition {
    /// Maps a value to its group key.
    std::function<u64(u64)> group;

    /// Maps a value to a bit index in `[0, block_bits)`.
    std::function<u64(u64)> local;

    /// The number of bits in every block.
    u32 block_bits = 0;

    /// Values above this maximum are rejected with \ref invalid_domain.
    boost::optional<u64> max_value;

    /// If non-empty, values whose group is not listed here are rejected
    /// with \ref unexpected_group.
    std::vector<u64> allowed_groups;
};

/// Returns the partition that uses the high bits of a value (`value >> shift`)
/// as the group and the low `shift` bits as the position within a block
/// of `2^shift` bits.
///
/// `byte_partition()` groups by high byte and indexes by low byte,
/// using 256 bit blocks.
///
/// \pre `0 < shift <= 16`.
partition byte_partition(u32 shift = 8);

/// Maps every group to a fixed-size bit vector. Bit `k` in the block of group `g`
/// is set iff the value with group `g` and local index `k` is a member.
///
/// Instances are built once from the complete set of values and are immutable
/// afterwards. Membership queries run in (expected) constant time,
/// storage is proportional to the number of distinct groups.
class bitset_index {
public:
    using value_type = u64;
    using group_type = u64;
    using block_type = boost::dynamic_bitset<u64>;

public:
    /// Builds an index from the given values.
    /// Duplicates are allowed, the order of `values` is irrelevant.
    ///
    /// \throws invalid_domain      If a value exceeds `p.max_value` or if its
    ///                             local index is not smaller than `p.block_bits`.
    /// \throws unexpected_group    If `p.allowed_groups` is not empty and does not
    ///                             contain the group of some value.
    static bitset_index build(gsl::span<const value_type> values, partition p);

public:
    /// Returns true iff `value` was part of the input set.
    /// Values of absent groups are not members.
    bool contains(value_type value) const;

    /// Returns the group keys that have a block, in ascending order.
    std::vector<group_type> groups() const;

    /// Returns true iff there is a block for the given group.
    bool has_group(group_type group) const {
        return m_blocks.find(group) != m_blocks.end();
    }

    /// Returns the block of the given group.
    /// \pre `has_group(group)`.
    const block_type& block(group_type group) const;

    /// Returns the block of the given group packed into bytes.
    /// Bit `k` is stored in byte `k / 8` at position `k % 8`.
    /// \pre `has_group(group)`.
    std::vector<u8> block_bytes(group_type group) const;

    /// The number of groups with a block.
    size_t group_count() const { return m_blocks.size(); }

    /// The number of bits per block.
    u32 block_bits() const { return m_partition.block_bits; }

    /// The number of bytes required to store all blocks in packed form.
    size_t byte_size() const {
        return group_count() * ((block_bits() + 7) / 8);
    }

    /// The partition this index was built with.
    const partition& get_partition() const { return m_partition; }

private:
    explicit bitset_index(partition p);

    /// Validates the value and sets its bit.
    void insert(value_type value);

private:
    partition m_partition;
    std::unordered_map<group_type, block_type> m_blocks;
};

} // namespace cipherlist

#endif // CIPHERLIST_BITSET_INDEX_HPP
