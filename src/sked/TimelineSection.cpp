#include "sked/TimelineSection.hpp"

namespace sked {

template class TimelineSection<double>;
template class TimelineSection<int64_t>;
template struct SectionModP<double>;
template struct SectionModP<int64_t>;

} // namespace sked
