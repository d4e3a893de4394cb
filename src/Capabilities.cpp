#include <errprop/Capabilities.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace errprop {

namespace {
bool isDisableRequest(std::string_view envValue) {
    if (envValue.empty()) {
        return false;
    }
    std::string lower(envValue);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    constexpr std::array<std::string_view, 4> kNegative{"0", "false", "off", "no"};
    return std::ranges::find(kNegative, lower) == kNegative.end();
}
} // namespace

Capabilities resolveCapabilities(const char* disableArraysEnv) {
    Capabilities result{};
    if (disableArraysEnv != nullptr && isDisableRequest(disableArraysEnv)) {
        result.arrays = false;
    }
    return result;
}

const Capabilities& globalCapabilities() {
    static const Capabilities instance = [] {
        const char* envValue = std::getenv("ERRPROP_DISABLE_ARRAYS");
        Capabilities capabilities = resolveCapabilities(envValue);
        if (kArraysCompiledIn && !capabilities.arrays) {
            fmt::print(stderr, "errprop: array support disabled via ERRPROP_DISABLE_ARRAYS='{}', scalar-only mode\n", envValue);
        }
        return capabilities;
    }();
    return instance;
}

} // namespace errprop
