#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

namespace capex {

/// Cell types a column can hold: raw cells (Value) and normalized amounts.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Owning, contiguous storage for one column of a Table.
template <ColumnElement T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    Column() = default;
    explicit Column(std::vector<T> data) : data_(std::move(data)) {}
    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    void push_back(const T& value) { data_.push_back(value); }

    template <typename... Args>
        requires std::constructible_from<T, Args...>
    auto emplace_back(Args&&... args) -> T& {
        return data_.emplace_back(std::forward<Args>(args)...);
    }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    /// Grow or shrink to `count` cells, filling new ones with `value`.
    void resize(size_type count, const T& value) { data_.resize(count, value); }

    /// Map every cell through `func` into a new column, e.g. raw cells to amounts.
    template <typename F>
        requires std::invocable<F, const T&>
    [[nodiscard]] auto transform(F func) const -> Column<std::invoke_result_t<F, const T&>> {
        std::vector<std::invoke_result_t<F, const T&>> out;
        out.reserve(data_.size());
        std::ranges::transform(data_, std::back_inserter(out), func);
        return Column<std::invoke_result_t<F, const T&>>{std::move(out)};
    }

    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace capex
