#include <boost/ut.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <errprop/Tensor.hpp>
#include <errprop/UnitTestHelper.hpp>

const boost::ut::suite tensorConstruction = [] {
    using namespace boost::ut;
    using namespace errprop;
    using errprop::test::throws_kind;

    "rank-1 initializer list"_test = [] {
        const Tensor<double> vec{1.0, 2.0, 3.0};
        expect(eq(vec.size(), 3UZ));
        expect(eq(vec.rank(), 1UZ));
        expect(eq(vec.extent(0), 3UZ));
        expect(eq(vec[2], 3.0));
        expect(!vec.empty());
    };

    "deduction from an initializer list"_test = [] {
        const Tensor vec{1.0f, 2.0f};
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(vec)>, Tensor<float>>);
        expect(eq(vec.size(), 2UZ));
    };

    "rank-2 nested initializer list"_test = [] {
        const Tensor<double> mat{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}};
        expect(eq(mat.rank(), 2UZ));
        expect(eq(mat.extent(0), 2UZ));
        expect(eq(mat.extent(1), 3UZ));
        expect(eq(mat[3], 4.0)) << "row-major storage";
    };

    "ragged nested initializer list"_test = [] { expect(throws_kind(ErrorKind::ShapeMismatch, [] { std::ignore = Tensor<double>{{1.0, 2.0}, {3.0}}; })); };

    "construction from extents"_test = [] {
        const Tensor<double> zeros(extents_from, {2UZ, 3UZ});
        expect(eq(zeros.size(), 6UZ));
        expect(eq(zeros.rank(), 2UZ));
        for (const auto& v : zeros) {
            expect(eq(v, 0.0));
        }

        const std::array<std::size_t, 1> extents{4UZ};
        const Tensor<double>             filled(extents_from, extents, 1.5);
        expect(eq(filled.size(), 4UZ));
        expect(eq(filled[3], 1.5));
    };

    "construction from data"_test = [] {
        std::vector<double>  data{1.0, 2.0, 3.0, 4.0};
        const Tensor<double> flat(data_from, data);
        expect(eq(flat.rank(), 1UZ));
        expect(eq(flat.size(), 4UZ));

        const Tensor<double> shaped(std::vector<std::size_t>{2UZ, 2UZ}, data);
        expect(eq(shaped.rank(), 2UZ));
        expect(throws_kind(ErrorKind::ShapeMismatch, [&] { std::ignore = Tensor<double>(std::vector<std::size_t>{3UZ, 2UZ}, data); }));
    };

    "default construction"_test = [] {
        const Tensor<double> empty;
        expect(empty.empty());
        expect(eq(empty.rank(), 0UZ));
    };
};

const boost::ut::suite tensorShape = [] {
    using namespace boost::ut;
    using namespace errprop;
    using errprop::test::throws_kind;

    "reshape"_test = [] {
        Tensor<double> mat{{1.0, 2.0}, {3.0, 4.0}};
        mat.reshape({4UZ});
        expect(eq(mat.rank(), 1UZ));
        expect(eq(mat, Tensor<double>{1.0, 2.0, 3.0, 4.0}));

        mat.reshape({1UZ, 4UZ});
        expect(eq(mat.extent(1), 4UZ));
        expect(throws_kind(ErrorKind::ShapeMismatch, [&] { mat.reshape({3UZ}); }));
        expect(eq(mat.rank(), 2UZ)) << "failed reshape leaves the extents untouched";
    };

    "equality includes extents"_test = [] {
        Tensor<double> row{1.0, 2.0, 3.0, 4.0};
        Tensor<double> mat{{1.0, 2.0}, {3.0, 4.0}};
        expect(row != mat);
        row.reshape({2UZ, 2UZ});
        expect(row == mat);
    };

    "element access and mutation"_test = [] {
        Tensor<double> vec{1.0, 2.0};
        vec[1] = 5.0;
        expect(eq(vec.data_span()[1], 5.0));
        for (auto& v : vec) {
            v *= 2.0;
        }
        expect(eq(vec, Tensor<double>{2.0, 10.0}));
    };

    "extents check"_test = [] {
        const Tensor<double> a{1.0, 2.0};
        const Tensor<double> b{3.0, 4.0};
        const Tensor<double> c{1.0, 2.0, 3.0};
        expect(nothrow([&] { checkSameExtents(a, b, "test"); }));
        expect(throws_kind(ErrorKind::ShapeMismatch, [&] { checkSameExtents(a, c, "test"); }));
        try {
            checkSameExtents(a, c, "operator+");
        } catch (const errprop::exception& e) {
            expect(eq(e.message, std::string("operator+: lhs extents [2] vs. rhs extents [3]")));
        }
    };

    "extents helpers"_test = [] {
        const std::array<std::size_t, 3> extents{2UZ, 3UZ, 4UZ};
        expect(eq(Tensor<double>::product(extents), 24UZ));
        expect(eq(Tensor<double>::product({}), 0UZ)) << "no extents, no elements";
        expect(eq(Tensor<double>::extentsString(extents), std::string("[2, 3, 4]")));
    };
};

int main() { /* tests are statically executed */ }
