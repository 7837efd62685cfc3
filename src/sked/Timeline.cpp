#include "sked/Timeline.hpp"

namespace sked {

template class Timeline<double>;
template class Timeline<int64_t>;

} // namespace sked
