#ifndef ERRPROP_UNITTESTHELPER_HPP
#define ERRPROP_UNITTESTHELPER_HPP

#include <boost/ut.hpp>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <ostream>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <errprop/Error.hpp>
#include <errprop/Tensor.hpp>
#include <errprop/UncertainValue.hpp>
#include <errprop/meta/utils.hpp>

namespace errprop::test {
using namespace boost::ut;

struct approx_result {
    bool                 success{};
    std::string          message{};
    std::source_location location = std::source_location::current();

    operator bool() const { return success; }
    friend std::ostream& operator<<(std::ostream& os, const approx_result& r) { return os << r.message; }
};

namespace detail {
template<std::floating_point E>
approx_result approxElements(std::string_view field, std::span<const E> lhs, std::span<const E> rhs, E tolerance, std::source_location location) {
    if (lhs.size() != rhs.size()) {
        return {false, fmt::format("{}: {} vs. {} elements", field, lhs.size(), rhs.size()), location};
    }
    for (std::size_t i = 0UZ; i < lhs.size(); ++i) {
        if (!(std::abs(lhs[i] - rhs[i]) <= tolerance)) { // NaN never matches
            return {false, fmt::format("{}[{}]: {} vs. {} (tolerance={})", field, i, lhs[i], rhs[i], tolerance), location};
        }
    }
    return {true, {}, location};
}

template<typename T>
std::span<const meta::fundamental_base_value_type_t<T>> elements(const T& field) {
    if constexpr (TensorLike<T>) {
        return field.data_span();
    } else {
        return {&field, 1UZ};
    }
}
} // namespace detail

/// element-wise approximate comparison of value and uncertainty of two (scalar or array-valued) instances
template<UncertainValueLike T, typename E = typename T::element_type>
approx_result approx_uncertain(const T& lhs, const T& rhs, E tolerance, std::source_location location = std::source_location::current()) {
    if constexpr (TensorLike<typename T::value_type>) {
        if (!std::ranges::equal(lhs.value().extents(), rhs.value().extents())) {
            return {false, fmt::format("extents {} vs. {}", Tensor<E>::extentsString(lhs.value().extents()), Tensor<E>::extentsString(rhs.value().extents())), location};
        }
    }
    if (auto result = detail::approxElements<E>("value", detail::elements(lhs.value()), detail::elements(rhs.value()), tolerance, location); !result) {
        return result;
    }
    if (auto result = detail::approxElements<E>("uncertainty", detail::elements(lhs.uncertainty()), detail::elements(rhs.uncertainty()), tolerance, location); !result) {
        return result;
    }
    return {true, fmt::format("{} vs. {} within tolerance={}", fmt::join(detail::elements(lhs.value()), ", "), fmt::join(detail::elements(rhs.value()), ", "), tolerance), location};
}

/// true iff 'callable' throws an errprop::exception of the given kind
template<typename Callable>
[[nodiscard]] bool throws_kind(ErrorKind kind, Callable&& callable) {
    try {
        std::forward<Callable>(callable)();
    } catch (const errprop::exception& e) {
        return e.kind == kind;
    }
    return false;
}

} // namespace errprop::test

#endif // ERRPROP_UNITTESTHELPER_HPP
