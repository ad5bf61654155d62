#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace va {

// Ordered sequence that always holds at least one element. There is no
// default constructor and no way to remove elements, so an empty instance
// cannot be built.
template <typename T>
class NonEmptyVector {
  public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    explicit NonEmptyVector(T head) { items_.push_back(std::move(head)); }

    NonEmptyVector(T head, std::vector<T> tail) {
        items_.reserve(tail.size() + 1);
        items_.push_back(std::move(head));
        for (auto& t : tail) items_.push_back(std::move(t));
    }

    NonEmptyVector(std::initializer_list<T> init) : items_(init) {
        if (items_.empty()) throw std::invalid_argument("NonEmptyVector requires at least one element");
    }

    // Returns std::nullopt when 'v' is empty.
    static std::optional<NonEmptyVector> fromVector(std::vector<T> v) {
        if (v.empty()) return std::nullopt;
        return NonEmptyVector(Unchecked{}, std::move(v));
    }

    const T& first() const { return items_.front(); }
    const T& last() const { return items_.back(); }
    std::size_t size() const noexcept { return items_.size(); }
    const T& operator[](std::size_t i) const { return items_[i]; }
    const T& at(std::size_t i) const { return items_.at(i); }

    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end() const noexcept { return items_.end(); }

    const std::vector<T>& toVector() const noexcept { return items_; }

    void push_back(T item) { items_.push_back(std::move(item)); }

    // Appends every element of 'other', keeping both orders.
    void append(const NonEmptyVector& other) {
        items_.insert(items_.end(), other.items_.begin(), other.items_.end());
    }

    template <typename F>
    auto map(F&& f) const -> NonEmptyVector<std::decay_t<std::invoke_result_t<F&, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F&, const T&>>;
        std::vector<U> out;
        out.reserve(items_.size());
        for (const auto& item : items_) out.push_back(f(item));
        return *NonEmptyVector<U>::fromVector(std::move(out));
    }

    template <typename Acc, typename F>
    Acc reduce(Acc initial, F&& f) const {
        for (const auto& item : items_) initial = f(std::move(initial), item);
        return initial;
    }

    friend bool operator==(const NonEmptyVector& a, const NonEmptyVector& b) { return a.items_ == b.items_; }
    friend bool operator!=(const NonEmptyVector& a, const NonEmptyVector& b) { return !(a == b); }

  private:
    struct Unchecked {};
    NonEmptyVector(Unchecked, std::vector<T> items) : items_(std::move(items)) {}

    std::vector<T> items_;
};

}  // namespace va
