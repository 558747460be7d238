#ifndef CIPHERLIST_EXPRESSION_HPP
#define CIPHERLIST_EXPRESSION_HPP

#include "cipherlist/bitset_index.hpp"
#include "cipherlist/common.hpp"
#include "cipherlist/interval.hpp"

#include <gsl/span>

#include <ostream>
#include <string>
#include <vector>

/// \file
/// Turns interval lists and bitset indexes into C conditional expressions
/// over a variable named `id`.

namespace cipherlist {

/// Formats `value` as uppercase hex with a `0x` prefix.
/// The number of digits is padded to be even, e.g. `0x0A`, `0xC02F`, `0x0100`.
std::string hex(u64 value);

/// A single disjunct of a membership condition.
/// Either `id == low` or `low <= id && id <= high`.
struct term {
    enum kind_t {
        equal, range
    };

    kind_t kind;
    u64 low;
    u64 high;

    /// True if this term was derived from the same interval as its predecessor
    /// and must be rendered on the same line.
    bool joined = false;

    bool matches(u64 id) const {
        return low <= id && id <= high;
    }

    /// The number of ids this term writes into the rendered expression.
    u32 weight() const {
        return kind == equal ? 1 : 2;
    }
};

bool operator==(const term& a, const term& b);
bool operator!=(const term& a, const term& b);
std::ostream& operator<<(std::ostream& o, const term& t);

/// Converts intervals into condition terms.
///
/// Intervals with at most `range_threshold` values become one equality test per value
/// (cheaper than a range compare for short runs), longer intervals become
/// a single range test.
std::vector<term> to_terms(const std::vector<interval<u64>>& intervals, u64 range_threshold = 2);

/// Returns true iff some term matches `id`.
bool evaluate(const std::vector<term>& terms, u64 id);

/// Renders the terms as a parenthesized disjunction suitable for the body of a
/// multi-line C macro. A new line is started whenever at least three ids have
/// been written on the current one.
///
/// Example:
///
///     ( \
///       id == 0x00 || (0x02 <= id && id <= 0x06) || \
///       id == 0x09 \
///     )
///
/// An empty term list renders as `(0)`.
std::string render_condition(const std::vector<term>& terms);

/// Renders a condition that tests membership by consulting the packed blocks of `index`
/// as C string literals. One block covers `2^shift` ids, i.e. the index must
/// have been built using `byte_partition(shift)`.
///
/// An empty index renders as `(0)`.
std::string render_lookup_condition(const bitset_index& index, u32 shift = 8);

/// Renders `case` labels for a C switch statement, five labels per line.
/// \pre `ids` contains no duplicates.
std::string render_switch_cases(gsl::span<const u64> ids);

} // namespace cipherlist

#endif // CIPHERLIST_EXPRESSION_HPP
