#include <boost/ut.hpp>

#include <cstdlib>
#include <string_view>
#include <tuple>

#include <errprop/Capabilities.hpp>
#include <errprop/UncertainValue.hpp>
#include <errprop/UnitTestHelper.hpp>

const boost::ut::suite capabilityResolution = [] {
    using namespace boost::ut;
    using namespace errprop;

    "unset environment keeps the compiled-in default"_test = [] { expect(eq(resolveCapabilities(nullptr).arrays, kArraysCompiledIn)); };

    "empty or negative values do not disable arrays"_test = [] {
        for (const char* value : {"", "0", "false", "FALSE", "Off", "no"}) {
            expect(eq(resolveCapabilities(value).arrays, kArraysCompiledIn)) << "ERRPROP_DISABLE_ARRAYS=" << value;
        }
    };

    "any other value disables arrays"_test = [] {
        for (const char* value : {"1", "true", "yes", "ON", "scalar-only"}) {
            expect(!resolveCapabilities(value).arrays) << "ERRPROP_DISABLE_ARRAYS=" << value;
        }
    };

    "global capabilities are resolved once"_test = [] {
        const Capabilities& first  = globalCapabilities();
        const Capabilities& second = globalCapabilities();
        expect(&first == &second);
        expect(eq(first.arrays, resolveCapabilities(std::getenv("ERRPROP_DISABLE_ARRAYS")).arrays));
    };
};

const boost::ut::suite capabilityGating = [] {
    using namespace boost::ut;
    using namespace errprop;
    using errprop::test::throws_kind;
    using Array = Tensor<double>;

    "scalar path is always available"_test = [] {
        const UncertainValue<double> x{1.0, 3.0};
        const UncertainValue<double> y{2.0, 4.0};
        expect(eq((x + y).value(), 3.0));
        expect(UncertainValue<double>::make(1.0, 3.0).has_value());
    };

    "array-valued construction follows the capability"_test = [] {
        if (globalCapabilities().arrays) {
            expect(nothrow([] { std::ignore = UncertainValue<Array>{Array{1.0, 2.0}, Array{3.0, 2.0}}; }));
            expect(nothrow([] { std::ignore = UncertainValue<Array>{}; }));
            expect(UncertainValue<Array>::make(Array{1.0, 2.0}, Array{3.0, 2.0}).has_value());
        } else {
            expect(throws_kind(ErrorKind::CapabilityUnavailable, [] { std::ignore = UncertainValue<Array>{Array{1.0, 2.0}, Array{3.0, 2.0}}; }));
            expect(throws_kind(ErrorKind::CapabilityUnavailable, [] { std::ignore = UncertainValue<Array>(Array{1.0, 2.0}); }));
            expect(throws_kind(ErrorKind::CapabilityUnavailable, [] { std::ignore = UncertainValue<Array>{}; })) << "default construction is gated as well";
            expect(throws_kind(ErrorKind::CapabilityUnavailable, [] { [[maybe_unused]] UncertainValue<Array> defaulted; }));

            const auto result = UncertainValue<Array>::make(Array{1.0, 2.0}, Array{3.0, 2.0});
            expect(!result.has_value());
            expect(result.error().kind == ErrorKind::CapabilityUnavailable);
            expect(std::string_view(result.error().message).contains("array support is disabled")) << result.error().message;
            expect(std::string_view(result.error().sourceLocation.file_name()).ends_with("qa_Capabilities.cpp")) << result.error().srcLoc();
        }
    };

    "plain tensors do not depend on the capability"_test = [] {
        Array a{1.0, 2.0};
        a.reshape({2UZ, 1UZ});
        expect(eq(a.rank(), 2UZ));
    };
};

int main() { /* tests are statically executed */ }
