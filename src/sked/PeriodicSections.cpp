#include "sked/PeriodicSections.hpp"

namespace sked {

template class PeriodicSections<double>;
template class PeriodicSections<int64_t>;

} // namespace sked
