#ifndef ERRPROP_UNCERTAINVALUE_HPP
#define ERRPROP_UNCERTAINVALUE_HPP

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <expected>
#include <numbers>
#include <source_location>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <errprop/Capabilities.hpp>
#include <errprop/Error.hpp>
#include <errprop/Tensor.hpp>
#include <errprop/meta/utils.hpp>

namespace errprop {

/**
 *
 * @brief Propagation of Uncertainties
 *
 * original idea by: Evan Manning, "Uncertainty Propagation in C++", NASA Jet Propulsion Laboratory,
 * C/C++ Users Journal Volume 14, Number 3, March, 1996
 * http://www.pennelynn.com/Documents/CUJ/HTML/14.03/MANNING/MANNING.HTM
 *
 * implements +,-,*,/ operators, the weighted combination '&' and the 'errprop::math' functions for
 * floating-point scalars and element-wise for 'Tensor<floating-point>', for details see:
 * https://en.wikipedia.org/wiki/Propagation_of_uncertainty#Example_formulae
 * This implements only propagation of uncorrelated symmetric errors (i.e. gaussian-type standard deviations).
 * A more rigorous treatment would require the calculation and propagation of the
 * corresponding covariance matrix which is out of scope of this implementation.
 *
 * Instances are immutable: every operation returns a new instance and the stored uncertainty is always >= 0.
 * Array-valued instances require 'globalCapabilities().arrays', otherwise construction (including
 * default construction) throws 'ErrorKind::CapabilityUnavailable'.
 * Constructors, 'make()' and 'percentError()' record the caller's source location in the thrown
 * 'errprop::exception'. Operators and 'errprop::math' functions record the location of the rule inside this header.
 */

template<typename T>
concept TensorLike = meta::is_instantiation_of<std::remove_cvref_t<T>, Tensor>;

template<typename T>
concept scalar_or_tensor_like = std::floating_point<T> || (TensorLike<T> && std::floating_point<typename T::value_type>);

template<scalar_or_tensor_like T>
class UncertainValue {
public:
    using value_type   = T;
    using element_type = meta::fundamental_base_value_type_t<T>;

    constexpr UncertainValue() requires(!TensorLike<T>) = default;

    explicit UncertainValue(std::source_location location = std::source_location::current()) requires TensorLike<T> { requireArrays(location); }

    constexpr UncertainValue(T value_, T uncertainty_, [[maybe_unused]] std::source_location location = std::source_location::current()) noexcept(!TensorLike<T>) : _value(std::move(value_)), _uncertainty(std::move(uncertainty_)) {
        if constexpr (TensorLike<T>) {
            requireArrays(location);
            checkSameExtents(_value, _uncertainty, "UncertainValue(value, uncertainty)", location);
            for (auto& u : _uncertainty) {
                u = std::abs(u);
            }
        } else {
            _uncertainty = std::abs(_uncertainty);
        }
    }

    explicit(false) constexpr UncertainValue(const T& value_, std::source_location location = std::source_location::current()) noexcept(!TensorLike<T>) : UncertainValue(value_, zeroLike(value_), location) {}

    [[nodiscard]] constexpr const T& value() const noexcept { return _value; }
    [[nodiscard]] constexpr const T& uncertainty() const noexcept { return _uncertainty; }

    /// 100 * |uncertainty / value|, throws 'ErrorKind::UndefinedResult' for a zero (element) value
    [[nodiscard]] T percentError(std::source_location location = std::source_location::current()) const;

    /// non-throwing construction, e.g. for array-valued input of unknown shape or with arrays possibly disabled
    [[nodiscard]] static std::expected<UncertainValue, Error> make(T value_, T uncertainty_, std::source_location location = std::source_location::current()) {
        try {
            return UncertainValue(std::move(value_), std::move(uncertainty_), location);
        } catch (const exception& e) {
            return std::unexpected(Error(e));
        }
    }

    /// true iff both value and uncertainty are equal, array operands must share the same extents
    [[nodiscard]] friend constexpr bool operator==(const UncertainValue& lhs, const UncertainValue& rhs) noexcept(!TensorLike<T>) {
        if constexpr (TensorLike<T>) {
            checkSameExtents(lhs._value, rhs._value, "operator==");
        }
        return lhs._value == rhs._value && lhs._uncertainty == rhs._uncertainty;
    }

private:
    T _value{};       /// mean value
    T _uncertainty{}; /// uncorrelated standard deviation

    static void requireArrays(std::source_location location) {
        if (!globalCapabilities().arrays) [[unlikely]] {
            throw exception(ErrorKind::CapabilityUnavailable, "array-valued UncertainValue requested but array support is disabled", location);
        }
    }

    static constexpr T zeroLike(const T& reference) {
        if constexpr (TensorLike<T>) {
            return T(extents_from, reference.extents());
        } else {
            return static_cast<T>(0);
        }
    }
};

template<typename T>
UncertainValue(T, T) -> UncertainValue<T>;

namespace detail {
template<typename T>
struct is_uncertain_value : std::false_type {};

template<typename T>
struct is_uncertain_value<UncertainValue<T>> : std::true_type {};

template<typename T>
struct UncertainValueValueType {
    using type = T;
};

template<typename T>
struct UncertainValueValueType<UncertainValue<T>> {
    using type = T;
};
} // namespace detail

template<typename T>
concept UncertainValueLike = detail::is_uncertain_value<std::remove_cvref_t<T>>::value;

template<typename T>
using UncertainValueType_t = typename detail::UncertainValueValueType<T>::type;

/// plain numbers (or, for array-valued instances, a Tensor of plain numbers) acting as zero-uncertainty constants
template<typename C, typename UV>
concept constant_for = UncertainValueLike<UV> && !UncertainValueLike<C> //
                       && (std::is_arithmetic_v<C> || (TensorLike<C> && TensorLike<typename UV::value_type> && std::is_arithmetic_v<typename C::value_type>));

template<typename T, typename U>
concept uncertain_operands = (UncertainValueLike<T> && std::same_as<T, U>) || constant_for<U, T> || constant_for<T, U>;

template<typename... Ts>
inline constexpr bool all_scalar_v = (!TensorLike<UncertainValueType_t<Ts>> && ...);

template<typename T>
requires UncertainValueLike<T> || std::is_arithmetic_v<T>
[[nodiscard]] constexpr auto value(const T& val) noexcept {
    if constexpr (UncertainValueLike<T>) {
        return val.value();
    } else {
        return val;
    }
}

template<typename T>
requires UncertainValueLike<T> || std::is_arithmetic_v<T>
[[nodiscard]] constexpr auto uncertainty(const T& val) noexcept {
    if constexpr (UncertainValueLike<T>) {
        return val.uncertainty();
    } else {
        return static_cast<T>(0);
    }
}

namespace detail {

template<typename C>
[[nodiscard]] constexpr auto elementAt(const C& constant, [[maybe_unused]] std::size_t idx) noexcept {
    if constexpr (TensorLike<C>) {
        return constant[idx];
    } else {
        return constant;
    }
}

/// applies the scalar rule 'kernel(value, uncertainty) -> std::pair' directly or element-wise
template<typename T, typename Kernel>
[[nodiscard]] constexpr UncertainValue<T> transform(const UncertainValue<T>& x, Kernel&& kernel) {
    if constexpr (TensorLike<T>) {
        T value(extents_from, x.value().extents());
        T uncertainty(extents_from, x.value().extents());
        for (std::size_t i = 0UZ; i < value.size(); ++i) {
            std::tie(value[i], uncertainty[i]) = kernel(x.value()[i], x.uncertainty()[i]);
        }
        return UncertainValue<T>{std::move(value), std::move(uncertainty)};
    } else {
        const auto [value, uncertainty] = kernel(x.value(), x.uncertainty());
        return UncertainValue<T>{static_cast<T>(value), static_cast<T>(uncertainty)};
    }
}

/// applies the scalar rule 'kernel(vx, ex, vy, ey) -> std::pair' directly or element-wise (extents must match)
template<typename T, typename Kernel>
[[nodiscard]] constexpr UncertainValue<T> zip(const UncertainValue<T>& x, const UncertainValue<T>& y, [[maybe_unused]] std::string_view operation, Kernel&& kernel) {
    if constexpr (TensorLike<T>) {
        checkSameExtents(x.value(), y.value(), operation);
        T value(extents_from, x.value().extents());
        T uncertainty(extents_from, x.value().extents());
        for (std::size_t i = 0UZ; i < value.size(); ++i) {
            std::tie(value[i], uncertainty[i]) = kernel(x.value()[i], x.uncertainty()[i], y.value()[i], y.uncertainty()[i]);
        }
        return UncertainValue<T>{std::move(value), std::move(uncertainty)};
    } else {
        const auto [value, uncertainty] = kernel(x.value(), x.uncertainty(), y.value(), y.uncertainty());
        return UncertainValue<T>{static_cast<T>(value), static_cast<T>(uncertainty)};
    }
}

/// applies the scalar rule 'kernel(vx, ex, c) -> std::pair' with a broadcast scalar or an element-wise Tensor constant
template<typename T, typename C, typename Kernel>
[[nodiscard]] constexpr UncertainValue<T> zipConstant(const UncertainValue<T>& x, const C& constant, [[maybe_unused]] std::string_view operation, Kernel&& kernel) {
    using E = typename UncertainValue<T>::element_type;
    if constexpr (TensorLike<T>) {
        if constexpr (TensorLike<C>) {
            checkSameExtents(x.value(), constant, operation);
        }
        T value(extents_from, x.value().extents());
        T uncertainty(extents_from, x.value().extents());
        for (std::size_t i = 0UZ; i < value.size(); ++i) {
            std::tie(value[i], uncertainty[i]) = kernel(x.value()[i], x.uncertainty()[i], static_cast<E>(elementAt(constant, i)));
        }
        return UncertainValue<T>{std::move(value), std::move(uncertainty)};
    } else {
        const auto [value, uncertainty] = kernel(x.value(), x.uncertainty(), static_cast<E>(constant));
        return UncertainValue<T>{static_cast<T>(value), static_cast<T>(uncertainty)};
    }
}

namespace kernel {
inline constexpr auto sum        = [](auto vx, auto ex, auto vy, auto ey) { return std::pair{vx + vy, std::hypot(ex, ey)}; };
inline constexpr auto difference = [](auto vx, auto ex, auto vy, auto ey) { return std::pair{vx - vy, std::hypot(ex, ey)}; };

// relative uncertainties add in quadrature, a zero operand value yields NaN
inline constexpr auto product = [](auto vx, auto ex, auto vy, auto ey) {
    const auto value = vx * vy;
    return std::pair{value, std::abs(value) * std::hypot(ex / vx, ey / vy)};
};
inline constexpr auto quotient = [](auto vx, auto ex, auto vy, auto ey) {
    const auto value = vx / vy;
    return std::pair{value, std::abs(value) * std::hypot(ex / vx, ey / vy)};
};

// inverse-variance weighted mean, a zero-uncertainty measurement has infinite weight and is returned as is
inline constexpr auto weightedMean = [](auto vx, auto ex, auto vy, auto ey) {
    using E = decltype(vx);
    if (ex == E(0) && ey == E(0)) [[unlikely]] {
        throw exception(ErrorKind::DivisionByZero, "weighted combination of two measurements without uncertainty");
    }
    if (ex == E(0)) {
        return std::pair{vx, E(0)};
    }
    if (ey == E(0)) {
        return std::pair{vy, E(0)};
    }
    const E weightX   = E(1) / (ex * ex);
    const E weightY   = E(1) / (ey * ey);
    const E weightSum = weightX + weightY;
    return std::pair{(weightX * vx + weightY * vy) / weightSum, std::sqrt(E(1) / weightSum)};
};
} // namespace kernel

} // namespace detail

template<scalar_or_tensor_like T>
T UncertainValue<T>::percentError(std::source_location location) const {
    const auto percent = [&location](element_type v, element_type e) {
        if (v == element_type(0)) [[unlikely]] {
            throw exception(ErrorKind::UndefinedResult, "percent error of a zero nominal value", location);
        }
        return element_type(100) * std::abs(e / v);
    };

    if constexpr (TensorLike<T>) {
        T result(extents_from, _value.extents());
        for (std::size_t i = 0UZ; i < result.size(); ++i) {
            result[i] = percent(_value[i], _uncertainty[i]);
        }
        return result;
    } else {
        return percent(_value, _uncertainty);
    }
}

/********************** some basic math operation definitions *********************************/

template<typename T, typename U>
requires uncertain_operands<T, U>
[[nodiscard]] constexpr auto operator+(const T& lhs, const U& rhs) noexcept(all_scalar_v<T, U>) {
    if constexpr (UncertainValueLike<T> && UncertainValueLike<U>) {
        return detail::zip(lhs, rhs, "operator+", detail::kernel::sum);
    } else if constexpr (UncertainValueLike<T>) {
        return detail::zipConstant(lhs, rhs, "operator+", [](auto vx, auto ex, auto c) { return std::pair{vx + c, ex}; });
    } else {
        return detail::zipConstant(rhs, lhs, "operator+", [](auto vx, auto ex, auto c) { return std::pair{c + vx, ex}; });
    }
}

template<UncertainValueLike T>
[[nodiscard]] constexpr T operator+(const T& val) noexcept(all_scalar_v<T>) {
    return val;
}

template<typename T, typename U>
requires uncertain_operands<T, U>
[[nodiscard]] constexpr auto operator-(const T& lhs, const U& rhs) noexcept(all_scalar_v<T, U>) {
    if constexpr (UncertainValueLike<T> && UncertainValueLike<U>) {
        return detail::zip(lhs, rhs, "operator-", detail::kernel::difference);
    } else if constexpr (UncertainValueLike<T>) {
        return detail::zipConstant(lhs, rhs, "operator-", [](auto vx, auto ex, auto c) { return std::pair{vx - c, ex}; });
    } else {
        return detail::zipConstant(rhs, lhs, "operator-", [](auto vx, auto ex, auto c) { return std::pair{c - vx, ex}; });
    }
}

template<UncertainValueLike T>
[[nodiscard]] constexpr T operator-(const T& val) noexcept(all_scalar_v<T>) {
    return detail::transform(val, [](auto v, auto e) { return std::pair{-v, e}; });
}

template<typename T, typename U>
requires uncertain_operands<T, U>
[[nodiscard]] constexpr auto operator*(const T& lhs, const U& rhs) noexcept(all_scalar_v<T, U>) {
    if constexpr (UncertainValueLike<T> && UncertainValueLike<U>) {
        return detail::zip(lhs, rhs, "operator*", detail::kernel::product);
    } else if constexpr (UncertainValueLike<T>) {
        return detail::zipConstant(lhs, rhs, "operator*", [](auto vx, auto ex, auto c) { return std::pair{vx * c, std::abs(c) * ex}; });
    } else {
        return detail::zipConstant(rhs, lhs, "operator*", [](auto vx, auto ex, auto c) { return std::pair{c * vx, std::abs(c) * ex}; });
    }
}

template<typename T, typename U>
requires uncertain_operands<T, U>
[[nodiscard]] constexpr auto operator/(const T& lhs, const U& rhs) noexcept(all_scalar_v<T, U>) {
    if constexpr (UncertainValueLike<T> && UncertainValueLike<U>) {
        return detail::zip(lhs, rhs, "operator/", detail::kernel::quotient);
    } else if constexpr (UncertainValueLike<T>) {
        return detail::zipConstant(lhs, rhs, "operator/", [](auto vx, auto ex, auto c) { return std::pair{vx / c, ex / std::abs(c)}; });
    } else {
        // c / x: derivative -c/x^2
        return detail::zipConstant(rhs, lhs, "operator/", [](auto vx, auto ex, auto c) { return std::pair{c / vx, std::abs(c * ex / (vx * vx))}; });
    }
}

/// weighted combination of two independent measurements of the same quantity
template<UncertainValueLike T>
[[nodiscard]] constexpr T operator&(const T& lhs, const T& rhs) {
    return detail::zip(lhs, rhs, "operator&", detail::kernel::weightedMean);
}

} // namespace errprop

namespace errprop::math {

template<typename T, typename U>
requires(std::is_arithmetic_v<T> && std::is_arithmetic_v<U>)
[[nodiscard]] constexpr auto pow(const T& base, U exponent) noexcept {
    return std::pow(base, exponent);
}

template<UncertainValueLike T, typename U>
requires std::is_arithmetic_v<U>
[[nodiscard]] constexpr T pow(const T& base, U exponent) noexcept(all_scalar_v<T>) {
    using E      = typename T::element_type;
    const auto n = static_cast<E>(exponent);
    return detail::transform(base, [n](E v, E e) {
        if (n == E(0)) [[unlikely]] {
            return std::pair{E(1), E(0)};
        }
        return std::pair{static_cast<E>(std::pow(v, n)), std::abs(n) * std::abs(static_cast<E>(std::pow(v, n - E(1)))) * e};
    });
}

template<UncertainValueLike T>
[[nodiscard]] constexpr T pow(const T& base, const T& exponent) noexcept(all_scalar_v<T>) {
    return detail::zip(base, exponent, "pow", [](auto vx, auto ex, auto vy, auto ey) {
        using E = decltype(vx);
        if (vy == E(0) && ey == E(0)) [[unlikely]] {
            return std::pair{E(1), E(0)};
        }
        const E value     = std::pow(vx, vy);
        const E powerTerm = vy * std::pow(vx, vy - E(1)) * ex;
        const E logTerm   = ey == E(0) ? E(0) : value * std::log(vx) * ey; // no log(x <= 0) for constant exponents
        return std::pair{value, std::hypot(powerTerm, logTerm)};
    });
}

/// floor division has no meaningful uncertainty propagation and always throws 'ErrorKind::UnsupportedOperation'
template<typename T, typename U>
requires uncertain_operands<T, U>
[[noreturn]] void floor_divide(const T&, const U&, std::source_location location = std::source_location::current()) {
    throw exception(ErrorKind::UnsupportedOperation, "floor division is not defined for uncertain values", location);
}

template<typename T>
[[nodiscard]] constexpr T sqrt(const T& value) noexcept(all_scalar_v<T>) {
    if constexpr (UncertainValueLike<T>) {
        return math::pow(value, typename T::element_type(0.5));
    } else {
        return std::sqrt(value);
    }
}

template<typename T>
[[nodiscard]] constexpr T sin(const T& x) noexcept(all_scalar_v<T>) {
    if constexpr (UncertainValueLike<T>) {
        return detail::transform(x, [](auto v, auto e) { return std::pair{std::sin(v), std::abs(std::cos(v) * e)}; });
    } else {
        return std::sin(x);
    }
}

template<typename T>
[[nodiscard]] constexpr T cos(const T& x) noexcept(all_scalar_v<T>) {
    if constexpr (UncertainValueLike<T>) {
        return detail::transform(x, [](auto v, auto e) { return std::pair{std::cos(v), std::abs(std::sin(v) * e)}; });
    } else {
        return std::cos(x);
    }
}

template<typename T>
[[nodiscard]] constexpr T exp(const T& x) noexcept(all_scalar_v<T>) {
    if constexpr (UncertainValueLike<T>) {
        return detail::transform(x, [](auto v, auto e) {
            const auto value = std::exp(v); // derivative(exp(x)) = exp(x)
            return std::pair{value, value * e};
        });
    } else {
        return std::exp(x);
    }
}

template<typename T>
[[nodiscard]] constexpr T log(const T& x) noexcept(all_scalar_v<T>) {
    if constexpr (UncertainValueLike<T>) {
        return detail::transform(x, [](auto v, auto e) { return std::pair{std::log(v), std::abs(e / v)}; }); // derivative(log(x)) = 1/x
    } else {
        return std::log(x);
    }
}

template<typename T>
[[nodiscard]] constexpr T log10(const T& x) noexcept(all_scalar_v<T>) {
    if constexpr (UncertainValueLike<T>) {
        return detail::transform(x, [](auto v, auto e) {
            constexpr auto ln10 = std::numbers::ln10_v<decltype(v)>;
            return std::pair{std::log10(v), std::abs(e / (v * ln10))}; // derivative(log10(x)) = 1 / (x * ln(10))
        });
    } else {
        return std::log10(x);
    }
}

template<typename T>
[[nodiscard]] constexpr T abs(const T& x) noexcept(all_scalar_v<T>) {
    if constexpr (UncertainValueLike<T>) {
        return detail::transform(x, [](auto v, auto e) { return std::pair{std::abs(v), e}; });
    } else {
        return std::abs(x);
    }
}

template<typename T>
[[nodiscard]] constexpr bool isfinite(const T& x) noexcept {
    if constexpr (UncertainValueLike<T> && TensorLike<UncertainValueType_t<T>>) {
        const auto finite = [](auto v) { return std::isfinite(v); };
        return std::ranges::all_of(x.value(), finite) && std::ranges::all_of(x.uncertainty(), finite);
    } else if constexpr (UncertainValueLike<T>) {
        return std::isfinite(x.value()) && std::isfinite(x.uncertainty());
    } else {
        return std::isfinite(x);
    }
}

} // namespace errprop::math

#endif // ERRPROP_UNCERTAINVALUE_HPP
