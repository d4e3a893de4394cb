#ifndef ERRPROP_TENSOR_HPP
#define ERRPROP_TENSOR_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <numeric>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <errprop/Error.hpp>

namespace errprop {

struct tensor_extents_tag {};
struct tensor_data_tag {};

inline constexpr tensor_extents_tag extents_from{};
inline constexpr tensor_data_tag    data_from{};

/**
 * @class Tensor
 * @brief element-wise array storage with run-time extents backing the array-valued UncertainValue
 *
 * @code
 * Tensor<double> vec{1.0, 2.0, 3.0};              // rank 1, extents {3}
 * Tensor<double> mat{{1.0, 2.0}, {3.0, 4.0}};     // rank 2, extents {2, 2}
 * Tensor<double> zeros(extents_from, {2, 3});      // 2x3, value-initialised
 * Tensor<double> flat(data_from, someVector);      // rank 1 view of an existing std::vector
 * mat.reshape({4});                                // same data, new extents
 * @endcode
 *
 * @note row-major (C/C++-style) ordering is used exclusively
 * @note element-wise operations require identical extents, there is no broadcasting between tensors
 */
template<typename ElementType>
struct Tensor {
    using value_type     = ElementType;
    using container_type = std::vector<ElementType>;
    using iterator       = typename container_type::iterator;
    using const_iterator = typename container_type::const_iterator;

    Tensor() = default;

    Tensor(std::initializer_list<ElementType> values) : _extents{values.size()}, _data(values) {}

    Tensor(std::initializer_list<std::initializer_list<ElementType>> rows) {
        const std::size_t nCols = rows.size() == 0UZ ? 0UZ : rows.begin()->size();
        _data.reserve(rows.size() * nCols);
        for (const auto& row : rows) {
            if (row.size() != nCols) {
                throw exception(ErrorKind::ShapeMismatch, fmt::format("ragged nested initializer list: row with {} instead of {} columns", row.size(), nCols));
            }
            _data.insert(_data.end(), row.begin(), row.end());
        }
        _extents = {rows.size(), nCols};
    }

    Tensor(tensor_extents_tag, std::span<const std::size_t> extents_, const ElementType& fillValue = ElementType{}) : _extents(extents_.begin(), extents_.end()), _data(product(extents_), fillValue) {}

    Tensor(tensor_extents_tag, std::initializer_list<std::size_t> extents_, const ElementType& fillValue = ElementType{}) : Tensor(extents_from, std::span(extents_.begin(), extents_.size()), fillValue) {}

    Tensor(tensor_data_tag, container_type data_) : _extents{data_.size()}, _data(std::move(data_)) {}

    Tensor(std::vector<std::size_t> extents_, container_type data_) : _extents(std::move(extents_)), _data(std::move(data_)) {
        if (product(_extents) != _data.size()) {
            throw exception(ErrorKind::ShapeMismatch, fmt::format("extents {} require {} elements, got {}", extentsString(_extents), product(_extents), _data.size()));
        }
    }

    [[nodiscard]] std::size_t                  size() const noexcept { return _data.size(); }
    [[nodiscard]] std::size_t                  rank() const noexcept { return _extents.size(); }
    [[nodiscard]] bool                         empty() const noexcept { return _data.empty(); }
    [[nodiscard]] std::span<const std::size_t> extents() const noexcept { return _extents; }
    [[nodiscard]] std::size_t                  extent(std::size_t d) const noexcept { return _extents[d]; }

    [[nodiscard]] std::span<ElementType>       data_span() noexcept { return std::span(_data); }
    [[nodiscard]] std::span<const ElementType> data_span() const noexcept { return std::span(_data); }

    [[nodiscard]] iterator       begin() noexcept { return _data.begin(); }
    [[nodiscard]] iterator       end() noexcept { return _data.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return _data.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return _data.end(); }

    ElementType&       operator[](std::size_t idx) noexcept { return _data[idx]; }
    const ElementType& operator[](std::size_t idx) const noexcept { return _data[idx]; }

    void reshape(std::span<const std::size_t> newExtents) {
        if (product(newExtents) != _data.size()) {
            throw exception(ErrorKind::ShapeMismatch, fmt::format("cannot reshape {} elements to extents {}", _data.size(), extentsString(newExtents)));
        }
        _extents.assign(newExtents.begin(), newExtents.end());
    }
    void reshape(std::initializer_list<std::size_t> newExtents) { reshape(std::span(newExtents.begin(), newExtents.size())); }

    [[nodiscard]] bool operator==(const Tensor& other) const noexcept { return _extents == other._extents && _data == other._data; }

    [[nodiscard]] static std::size_t product(std::span<const std::size_t> ex) noexcept { return std::accumulate(ex.begin(), ex.end(), ex.empty() ? 0UZ : 1UZ, std::multiplies<>()); }

    [[nodiscard]] static std::string extentsString(std::span<const std::size_t> ex) { return fmt::format("[{}]", fmt::join(ex, ", ")); }

private:
    std::vector<std::size_t> _extents;
    container_type           _data;
};

template<typename T>
Tensor(std::initializer_list<T>) -> Tensor<T>;

template<typename T, typename U>
void checkSameExtents(const Tensor<T>& lhs, const Tensor<U>& rhs, std::string_view operation, std::source_location location = std::source_location::current()) {
    if (!std::ranges::equal(lhs.extents(), rhs.extents())) [[unlikely]] {
        throw exception(ErrorKind::ShapeMismatch, fmt::format("{}: lhs extents {} vs. rhs extents {}", operation, Tensor<T>::extentsString(lhs.extents()), Tensor<U>::extentsString(rhs.extents())), location);
    }
}

} // namespace errprop

#endif // ERRPROP_TENSOR_HPP
