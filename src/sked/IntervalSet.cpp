#include "sked/IntervalSet.hpp"

namespace sked {

template class IntervalSet<double>;
template class IntervalSet<int64_t>;

} // namespace sked
