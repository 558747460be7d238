#ifndef CIPHERLIST_ALGORITHM_HPP
#define CIPHERLIST_ALGORITHM_HPP

#include "cipherlist/common.hpp"

#include <boost/range/concepts.hpp>
#include <boost/range/functions.hpp>
#include <boost/range/metafunctions.hpp>

#include <algorithm>
#include <vector>

namespace cipherlist {

/// Invokes the function object `f` for every pair of adjacent elements
/// in `r`.
///
/// For example, if `r = [1, 2, 3]`, this algorithm will
/// call `f(1, 2)` and `f(2, 3)`.
template<typename FwdRange, typename Function>
void for_each_adjacent(FwdRange&& r, Function&& f) {
    BOOST_CONCEPT_ASSERT(( boost::ForwardRangeConcept<FwdRange> ));

    auto current = boost::begin(r);
    auto last = boost::end(r);

    if (current != last) {
        auto previous = current;
        ++current;
        for (; current != last; ++current, ++previous) {
            f(*previous, *current);
        }
    }
}

/// Copies the range into a new vector, sorted in ascending order
/// and without duplicates.
template<typename Range>
std::vector<typename boost::range_value<Range>::type> sorted_unique(const Range& r) {
    std::vector<typename boost::range_value<Range>::type> result(boost::begin(r), boost::end(r));
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

/// True iff `r` contains `t`.
template<typename Range, typename T>
bool contains(const Range& r, const T& t) {
    return std::find(boost::begin(r), boost::end(r), t) != boost::end(r);
}

} // namespace cipherlist

#endif // CIPHERLIST_ALGORITHM_HPP
