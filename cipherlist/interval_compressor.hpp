#ifndef CIPHERLIST_INTERVAL_COMPRESSOR_HPP
#define CIPHERLIST_INTERVAL_COMPRESSOR_HPP

#include "cipherlist/common.hpp"
#include "cipherlist/interval.hpp"

#include <boost/optional.hpp>
#include <boost/range/concepts.hpp>
#include <boost/range/functions.hpp>
#include <boost/range/metafunctions.hpp>

#include <type_traits>
#include <utility>
#include <vector>

/// \file
/// Collapses a sorted sequence of integers into maximal runs.

namespace cipherlist {

/// Turns a non-decreasing sequence of integers into the minimal list
/// of closed intervals that covers exactly the distinct input values.
///
/// Values are fed one at a time; the accumulator keeps the run that is
/// currently being extended and emits it as soon as the next value
/// leaves a gap. Duplicates are ignored.
///
/// The resulting intervals are sorted, disjoint and no two neighbors
/// can be merged, i.e. `a.end() + 1 < b.begin()` for every adjacent
/// pair `a, b`.
///
/// Runtime complexity: O(1) per value.
template<typename T>
class interval_compressor {
    static_assert(std::is_unsigned<T>::value, "values must be unsigned integers");

public:
    using value_type = T;
    using interval_type = interval<T>;

public:
    /// Compresses the given (sorted, non-decreasing) range of values.
    /// Equivalent to feeding every value and calling `finish()`.
    template<typename Range>
    static std::vector<interval_type> compress(const Range& values) {
        BOOST_CONCEPT_ASSERT(( boost::SinglePassRangeConcept<const Range> ));

        interval_compressor c;
        for (const auto& v : values) {
            c.feed(static_cast<T>(v));
        }
        return c.finish();
    }

public:
    interval_compressor() = default;

    /// Adds the next value.
    /// \pre `value` is not smaller than any previously fed value
    ///      (since the last call to `finish()`).
    void feed(T value) {
        if (!m_low) {
            m_low = value;
            m_high = value;
            return;
        }

        cipherlist_assert(value >= *m_high, "values must be fed in non-decreasing order");
        if (value == *m_high) {
            return;
        }
        if (value == *m_high + 1) {
            m_high = value;
            return;
        }

        m_result.emplace_back(*m_low, *m_high);
        m_low = value;
        m_high = value;
    }

    /// Emits the open interval (if any) and returns all intervals
    /// produced since construction or the last call to `finish()`.
    /// The compressor is empty afterwards and can be reused.
    std::vector<interval_type> finish() {
        if (m_low) {
            m_result.emplace_back(*m_low, *m_high);
        }
        m_low = boost::none;
        m_high = boost::none;
        return std::exchange(m_result, std::vector<interval_type>());
    }

    /// True iff no value has been fed since the last `finish()`.
    bool empty() const { return !m_low; }

    /// The number of intervals that have been completed so far.
    /// The currently open run is not counted.
    size_t completed() const { return m_result.size(); }

private:
    boost::optional<T> m_low;
    boost::optional<T> m_high;
    std::vector<interval_type> m_result;
};

/// Compresses the given sorted range of values using `interval_compressor`.
template<typename Range>
auto compress(const Range& values) {
    using value_type = typename boost::range_value<const Range>::type;
    return interval_compressor<value_type>::compress(values);
}

} // namespace cipherlist

#endif // CIPHERLIST_INTERVAL_COMPRESSOR_HPP
