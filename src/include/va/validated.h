#pragma once

#include <optional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "va/non_empty.h"

namespace va {

// Outcome of a validation: either valid, holding the checked value, or
// invalid, holding one or more errors in the order they were produced.
template <typename Value, typename Error>
class Validated {
  public:
    using value_type = Value;
    using error_type = Error;

    static Validated valid(Value value) { return Validated(std::in_place_index<0>, std::move(value)); }

    static Validated invalid(NonEmptyVector<Error> errors) {
        return Validated(std::in_place_index<1>, std::move(errors));
    }

    // Invalid with exactly one error.
    static Validated error(Error e) { return invalid(NonEmptyVector<Error>(std::move(e))); }

    bool isValid() const noexcept { return storage_.index() == 0; }
    bool isInvalid() const noexcept { return !isValid(); }
    explicit operator bool() const noexcept { return isValid(); }

    const Value& value() const {
        if (!isValid()) throw std::logic_error("value() called on an invalid result");
        return std::get<0>(storage_);
    }

    // The error list of an invalid result. Throws on a valid one.
    const NonEmptyVector<Error>& errorList() const {
        if (isValid()) throw std::logic_error("errorList() called on a valid result");
        return std::get<1>(storage_);
    }

    // Returns std::nullopt when valid.
    std::optional<NonEmptyVector<Error>> errors() const {
        if (isValid()) return std::nullopt;
        return std::get<1>(storage_);
    }

    template <typename F>
    auto map(F&& f) const -> Validated<std::decay_t<std::invoke_result_t<F&, const Value&>>, Error> {
        using Result = Validated<std::decay_t<std::invoke_result_t<F&, const Value&>>, Error>;
        if (isValid()) return Result::valid(f(std::get<0>(storage_)));
        return Result::invalid(std::get<1>(storage_));
    }

    template <typename F>
    auto mapErrors(F&& f) const -> Validated<Value, std::decay_t<std::invoke_result_t<F&, const Error&>>> {
        using Result = Validated<Value, std::decay_t<std::invoke_result_t<F&, const Error&>>>;
        if (isValid()) return Result::valid(std::get<0>(storage_));
        return Result::invalid(std::get<1>(storage_).map(f));
    }

    // Folds the error list into a single error of type Acc.
    template <typename Acc, typename F>
    Validated<Value, Acc> reduceErrors(Acc initial, F&& reducer) const {
        if (isValid()) return Validated<Value, Acc>::valid(std::get<0>(storage_));
        return Validated<Value, Acc>::error(std::get<1>(storage_).reduce(std::move(initial), reducer));
    }

    friend bool operator==(const Validated& a, const Validated& b) { return a.storage_ == b.storage_; }
    friend bool operator!=(const Validated& a, const Validated& b) { return !(a == b); }

  private:
    template <std::size_t I, typename Arg>
    Validated(std::in_place_index_t<I> tag, Arg&& arg) : storage_(tag, std::forward<Arg>(arg)) {}

    std::variant<Value, NonEmptyVector<Error>> storage_;
};

// Merges results: valid with a tuple of every value when all are valid,
// otherwise invalid with the errors of each invalid argument, in argument order.
template <typename Error, typename... Values>
Validated<std::tuple<Values...>, Error> zip(const Validated<Values, Error>&... results) {
    using Result = Validated<std::tuple<Values...>, Error>;
    std::optional<NonEmptyVector<Error>> errors;
    auto collect = [&errors](const auto& r) {
        if (r.isValid()) return;
        if (errors) {
            errors->append(r.errorList());
        } else {
            errors.emplace(r.errorList());
        }
    };
    (collect(results), ...);
    if (errors) return Result::invalid(std::move(*errors));
    return Result::valid(std::make_tuple(results.value()...));
}

}  // namespace va
