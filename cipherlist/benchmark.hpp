#ifndef CIPHERLIST_BENCHMARK_HPP
#define CIPHERLIST_BENCHMARK_HPP

#include "cipherlist/bitset_index.hpp"
#include "cipherlist/cipher_list.hpp"
#include "cipherlist/common.hpp"

#include <boost/optional.hpp>

#include <string>
#include <vector>

/// \file
/// Generates a C program that compares the speed of several ways to test
/// whether a cipher id is on the blacklist.

namespace cipherlist {

struct benchmark_options {
    /// Number of random ids tested by every method.
    u64 id_count = 10000000;

    /// Random ids are masked with this value (`rand() & id_mask`).
    u32 id_mask = 32767;

    /// Intervals with at most this many ids are tested with `==`
    /// instead of a range comparison.
    u64 range_threshold = 2;

    /// Every lookup table covers `2^shift` ids.
    u32 shift = 8;

    /// Larger cipher ids abort the generation.
    boost::optional<u64> max_id = u64(0xFFFF);

    /// Ids outside of these groups (`id >> shift`) abort the generation.
    /// An empty list allows all groups.
    std::vector<u64> allowed_groups{0x00, 0xC0};
};

/// Returns the lookup table partition described by the options.
partition make_partition(const benchmark_options& options);

/// The generated program and some figures about its content.
struct benchmark_source {
    std::string text;

    size_t ciphers = 0;         ///< Entries in the cipher array.
    size_t intervals = 0;       ///< Intervals of distinct ids.
    size_t terms = 0;           ///< Disjuncts in the conditional logic.
    size_t tables = 0;          ///< Lookup tables.
    size_t table_bytes = 0;     ///< Size of all lookup tables.
};

/// Generates the benchmark program for the given blacklist.
///
/// The program contains five methods that test whether an id is banned:
///
///     0. a linear scan of the sorted cipher array (the reference result),
///     1. conditional logic built from the intervals of banned ids,
///     2. conditional logic with lookup tables,
///     3. a binary search of the cipher array,
///     4. a switch statement.
///
/// \param banned   The blacklisted ciphers, sorted by id (see \ref resolve_blacklist).
///
/// \throws std::invalid_argument   If `banned` is empty.
/// \throws index_error             If some id is rejected by the lookup table partition.
benchmark_source generate_benchmark(const std::vector<cipher>& banned,
                                    const benchmark_options& options = benchmark_options());

} // namespace cipherlist

#endif // CIPHERLIST_BENCHMARK_HPP
