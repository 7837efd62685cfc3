#include "sked/Interval.hpp"

namespace sked {

template struct Interval<double>;
template struct Interval<int64_t>;

} // namespace sked
