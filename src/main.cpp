#include <cstdio>
#include <cstdlib>
#include <exception>

#include <fmt/format.h>

#include <errprop/Capabilities.hpp>
#include <errprop/Error.hpp>
#include <errprop/UncertainValue.hpp>
#include <errprop/formatter.hpp>

namespace {

void printScalarExamples() {
    using errprop::UncertainValue;
    const UncertainValue<double> x{1.0, 3.0};
    const UncertainValue<double> y{2.0, 4.0};

    fmt::print("x = {}, y = {}\n", x, y);
    fmt::print("x + y      = {}\n", x + y);
    fmt::print("x - y      = {}\n", x - y);
    fmt::print("x + 4      = {}\n", x + 4.0);
    fmt::print("x - 4      = {}\n", x - 4.0);
    fmt::print("2 * x      = {}\n", 2.0 * x);
    fmt::print("pow(x, 2)  = {}\n", errprop::math::pow(x, 2));
    fmt::print("x * y      = {:.6f}\n", x * y);
    fmt::print("x / y      = {:.6f}\n", x / y);
    fmt::print("x & y      = {:.6f}\n", x & y);
    fmt::print("x & x      = {:.6f}\n", x & x);
    fmt::print("x == x     = {}, x == y = {}\n", x == x, x == y);
    fmt::print("percentError(x) = {}%\n", x.percentError());

    try {
        errprop::math::floor_divide(x, y);
    } catch (const errprop::exception& e) {
        fmt::print("floor_divide(x, y) -> {}\n", errprop::Error(e));
    }
}

void printArrayExamples() {
    using Array = errprop::Tensor<double>;
    const auto result = errprop::UncertainValue<Array>::make(Array{1.0, 2.0}, Array{3.0, 2.0});
    if (!result) {
        fmt::print("array examples skipped: {}\n", result.error());
        return;
    }
    const auto& a = *result;
    fmt::print("a          = {}\n", a);
    fmt::print("a * 2      = {}\n", a * 2.0);
    fmt::print("sqrt(a)    = {:.4f}\n", errprop::math::sqrt(a));

    const auto mismatched = errprop::UncertainValue<Array>::make(Array{1.0, 2.0, 3.0}, Array{1.0, 1.0});
    if (!mismatched) {
        fmt::print("mismatched extents -> {}\n", mismatched.error().kind);
    }
}

} // namespace

int main() {
    try {
        printScalarExamples();
        fmt::print("array support: {}\n", errprop::globalCapabilities().arrays ? "enabled" : "disabled");
        printArrayExamples();
    } catch (const std::exception& e) {
        fmt::print(stderr, "errprop-demo: {}\n", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
