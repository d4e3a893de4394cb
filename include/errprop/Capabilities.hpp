#ifndef ERRPROP_CAPABILITIES_HPP
#define ERRPROP_CAPABILITIES_HPP

#ifndef ERRPROP_ENABLE_ARRAYS
#define ERRPROP_ENABLE_ARRAYS 1
#endif

namespace errprop {

inline constexpr bool kArraysCompiledIn = ERRPROP_ENABLE_ARRAYS != 0;

/**
 * @brief optional features of the library, resolved once per process
 *
 * 'arrays' gates array-valued UncertainValue<Tensor<T>> instances. It is compiled in via the
 * 'ERRPROP_ENABLE_ARRAYS' CMake option and may additionally be switched off at start-up by
 * setting the environment variable 'ERRPROP_DISABLE_ARRAYS' (any value except "0", "false", "off", "no").
 * The scalar code path is always available.
 */
struct Capabilities {
    bool arrays = kArraysCompiledIn;
};

/// pure resolution step: 'disableArraysEnv' is the raw value of ERRPROP_DISABLE_ARRAYS (nullptr if unset)
[[nodiscard]] Capabilities resolveCapabilities(const char* disableArraysEnv);

[[nodiscard]] const Capabilities& globalCapabilities();

} // namespace errprop

#endif // ERRPROP_CAPABILITIES_HPP
