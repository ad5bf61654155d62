#pragma once

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "va/validated.h"

namespace va {

// Immutable wrapper around a pure function from a value to a Validated
// result. Validators are plain values: copy them, store them, compose them.
//
// The wrapped function must be deterministic and free of side effects, and on
// success it must hand back the input unchanged. Combinators such as pullback
// and combine rely on both properties.
template <typename Value, typename Error = std::string>
class Validator {
  public:
    using value_type = Value;
    using error_type = Error;
    using Result = Validated<Value, Error>;
    using Function = std::function<Result(const Value&)>;

    template <typename F,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, Validator> &&
                                          std::is_invocable_r_v<Result, F&, const Value&>>>
    explicit Validator(F&& fn) : fn_(std::forward<F>(fn)) {}

    Result validate(const Value& value) const { return fn_(value); }
    Result operator()(const Value& value) const { return fn_(value); }

    // Runs this validator against transform(local). On success the original
    // local value is returned, errors pass through untouched.
    template <typename LocalValue, typename F>
    Validator<LocalValue, Error> pullback(F transform) const {
        Function self = fn_;
        return Validator<LocalValue, Error>(
            [self, transform](const LocalValue& local) -> Validated<LocalValue, Error> {
                return self(transform(local)).map([&local](const Value&) { return local; });
            });
    }

    template <typename F>
    auto mapErrors(F transform) const -> Validator<Value, std::decay_t<std::invoke_result_t<F&, const Error&>>> {
        using LocalError = std::decay_t<std::invoke_result_t<F&, const Error&>>;
        Function self = fn_;
        return Validator<Value, LocalError>(
            [self, transform](const Value& value) { return self(value).mapErrors(transform); });
    }

    // Collapses the error list into a single accumulated error.
    template <typename Acc, typename F>
    Validator<Value, Acc> reduceErrors(Acc initial, F reducer) const {
        Function self = fn_;
        return Validator<Value, Acc>([self, initial = std::move(initial), reducer](const Value& value) {
            return self(value).reduceErrors(initial, reducer);
        });
    }

    // Valid exactly when this validator is not. The caller supplies the error
    // for the inverted case; this validator's own errors are dropped.
    Validator negated(Error error) const {
        Function self = fn_;
        return Validator([self, error = std::move(error)](const Value& value) {
            if (self(value).isValid()) return Result::error(error);
            return Result::valid(value);
        });
    }

    // Lifts to an optional input. A present value is delegated to this
    // validator. An absent one is invalid with 'errorOnNil' when given,
    // valid otherwise.
    Validator<std::optional<Value>, Error> optional(std::optional<Error> errorOnNil) const {
        using Lifted = Validated<std::optional<Value>, Error>;
        Function self = fn_;
        return Validator<std::optional<Value>, Error>(
            [self, errorOnNil = std::move(errorOnNil)](const std::optional<Value>& value) -> Lifted {
                if (value) return self(*value).map([](const Value& v) { return std::optional<Value>(v); });
                if (errorOnNil) return Lifted::error(*errorOnNil);
                return Lifted::valid(std::nullopt);
            });
    }

    template <typename E = Error, typename = std::enable_if_t<std::is_same_v<E, std::string>>>
    Validator<std::optional<Value>, Error> optional(bool allowNil) const {
        if (allowNil) return optional(std::optional<Error>());
        return optional(std::optional<Error>(std::string("is required")));
    }

    // Without this overload a string literal would convert to bool.
    template <typename E = Error, typename = std::enable_if_t<std::is_same_v<E, std::string>>>
    Validator<std::optional<Value>, Error> optional(const char* errorOnNil) const {
        return optional(std::optional<Error>(std::string(errorOnNil)));
    }

    // Runs every validator against the same input, in order, without
    // stopping at the first failure. The result is invalid when any of them
    // is, carrying all their errors in list order. An empty list always passes.
    static Validator combine(std::vector<Validator> validators) {
        return Validator([validators = std::move(validators)](const Value& value) {
            Result merged = Result::valid(value);
            for (const auto& validator : validators) {
                merged = zip(merged, validator.validate(value)).map([&value](const auto&) { return value; });
            }
            return merged;
        });
    }

    template <typename... Rest>
    static Validator combine(const Validator& first, const Rest&... rest) {
        static_assert((std::is_same_v<Rest, Validator> && ...), "combine expects validators of the same type");
        return combine(std::vector<Validator>{first, rest...});
    }

    // Validates a property derived from the value, e.g. the length of a list.
    template <typename T, typename F>
    static Validator its(F transform, const Validator<T, Error>& validator) {
        return validator.template pullback<Value>(std::move(transform));
    }

  private:
    Function fn_;
};

}  // namespace va
