#ifndef ERRPROP_FORMATTER_HPP
#define ERRPROP_FORMATTER_HPP

#include <ostream>
#include <string_view>

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <errprop/Error.hpp>
#include <errprop/UncertainValue.hpp>

// simplified formatter for UncertainValue, the format-spec applies to each (element) value and uncertainty
template<errprop::scalar_or_tensor_like T>
struct fmt::formatter<errprop::UncertainValue<T>> {
    using element_type = typename errprop::UncertainValue<T>::element_type;
    formatter<element_type> value_formatter;

    constexpr auto parse(format_parse_context& ctx) { return value_formatter.parse(ctx); }

    template<typename FormatContext>
    auto format(const errprop::UncertainValue<T>& uv, FormatContext& ctx) const {
        auto out = ctx.out();
        out      = fmt::format_to(out, "(");
        out      = formatField(uv.value(), ctx);
        out      = fmt::format_to(out, " ± ");
        out      = formatField(uv.uncertainty(), ctx);
        out      = fmt::format_to(out, ")");
        return out;
    }

private:
    template<typename FormatContext>
    auto formatField(const T& field, FormatContext& ctx) const {
        if constexpr (errprop::TensorLike<T>) {
            auto out   = fmt::format_to(ctx.out(), "[");
            bool first = true;
            for (const auto& element : field) {
                if (!first) {
                    out = fmt::format_to(out, ", ");
                }
                first = false;
                out   = value_formatter.format(element, ctx);
            }
            return fmt::format_to(out, "]");
        } else {
            return value_formatter.format(field, ctx);
        }
    }
};

template<>
struct fmt::formatter<errprop::ErrorKind> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(errprop::ErrorKind kind, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(magic_enum::enum_name(kind), ctx);
    }
};

template<>
struct fmt::formatter<errprop::Error> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const errprop::Error& error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}: {} at {}", error.kind, error.message, error.srcLoc());
    }
};

namespace errprop {
template<UncertainValueLike T>
std::ostream& operator<<(std::ostream& os, const T& v) {
    return os << fmt::format("{}", v);
}
} // namespace errprop

#endif // ERRPROP_FORMATTER_HPP
