#ifndef SRC_SKED_NUMERIC_TRAITS_HPP_
#define SRC_SKED_NUMERIC_TRAITS_HPP_

#include <cmath>
#include <type_traits>

namespace sked {

// Interval bounds need ordering, subtraction and addition of a delta. Everything else the algebra needs from a bound
// type lives here, so fixed-point or other user-defined types can specialize NumericTraits instead of the containers.
template<typename T>
struct NumericTraits {
    static_assert(std::is_arithmetic_v<T>, "Specialize NumericTraits for non-arithmetic bound types.");

    static constexpr T zero() { return T(0); }

    // Edge matching tolerance used by Timeline. Integral timelines match edges exactly.
    static constexpr T defaultEpsilon() {
        if constexpr (std::is_floating_point_v<T>) {
            return T(0.001);
        } else {
            return T(0);
        }
    }

    static T abs(T value) { return value < zero() ? zero() - value : value; }

    // Remainder taking the sign of |period|, so for positive periods the result is always in [0, period).
    static T mod(T value, T period) {
        T remainder;
        if constexpr (std::is_floating_point_v<T>) {
            remainder = std::fmod(value, period);
        } else {
            remainder = value % period;
        }
        if (remainder != zero() && ((remainder < zero()) != (period < zero()))) {
            remainder += period;
        }
        return remainder;
    }
};

} // namespace sked

#endif // SRC_SKED_NUMERIC_TRAITS_HPP_
