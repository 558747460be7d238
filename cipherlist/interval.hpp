#ifndef CIPHERLIST_INTERVAL_HPP
#define CIPHERLIST_INTERVAL_HPP

#include "cipherlist/common.hpp"

#include <ostream>
#include <type_traits>

/// \file
/// Contains a closed interval type over unsigned integers.

namespace cipherlist {

/// An interval `[begin, end]` of integers.
/// Intervals contain both their beginning and their end point,
/// an interval with `begin == end` represents a single value.
/// There are no empty intervals.
template<typename T>
class interval {
    static_assert(std::is_integral<T>::value, "intervals are defined over integers");

public:
    using value_type = T;

public:
    /// Constructs an interval of size 1 representing `point`.
    interval(T point): interval(point, point) {}

    /// Constructs a new interval with the given `begin` and `end`.
    /// \pre `begin <= end`.
    interval(T begin, T end): m_begin(begin), m_end(end) {
        cipherlist_assert(begin <= end, "invalid interval");
    }

    /// Returns the first value in the interval.
    T begin() const { return m_begin; }

    /// Returns the last value in the interval.
    T end() const { return m_end; }

    /// Returns the number of values in this interval.
    /// Wraps around for an interval that spans the entire domain of `T`.
    T length() const { return m_end - m_begin + 1; }

    /// True iff this interval contains exactly one value.
    bool is_point() const { return m_begin == m_end; }

    /// Returns true iff this interval contains the given point.
    bool contains(T point) const {
        return point >= m_begin && point <= m_end;
    }

    /// Returns true if this interval contains the other interval.
    bool contains(const interval& other) const {
        return other.m_begin >= m_begin && other.m_end <= m_end;
    }

    /// Returns true if this interval and `other` share at least
    /// one common integer.
    bool overlaps(const interval& other) const {
        return other.m_end >= m_begin && other.m_begin <= m_end;
    }

    /// Returns true if `other` starts immediately after this interval ends,
    /// i.e. both could be merged into one interval without a gap.
    bool precedes_adjacent(const interval& other) const {
        return m_end < other.m_begin && m_end + 1 == other.m_begin;
    }

private:
    T m_begin;
    T m_end;
};

template<typename T>
bool operator==(const interval<T>& a, const interval<T>& b) {
    return a.begin() == b.begin() && a.end() == b.end();
}

template<typename T>
bool operator!=(const interval<T>& a, const interval<T>& b) {
    return !(a == b);
}

template<typename T>
std::ostream& operator<<(std::ostream& o, const interval<T>& i) {
    if (i.is_point()) {
        return o << "[" << +i.begin() << "]";
    }
    return o << "[" << +i.begin() << "-" << +i.end() << "]";
}

} // namespace cipherlist

#endif // CIPHERLIST_INTERVAL_HPP
