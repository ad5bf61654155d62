#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "va/debug.h"
#include "va/validated.h"
#include "va/validator.h"

namespace va {

// A value bound to a fixed validator. The latest result is cached and is
// recomputed synchronously on every mutation, so result() always equals
// validator().validate(value()). Reading never re-evaluates.
//
// Owning types construct bindings in their constructors:
//
//   struct Signup {
//       Validating<std::string> name{"", isNotEmpty()};
//       Validating<int> age{0, isAtLeast(18), isAtMost(130)};
//   };
//
// Not thread safe; callers sharing a binding must serialize access.
template <typename Value, typename Error = std::string>
class Validating {
  public:
    using ValidatorType = Validator<Value, Error>;
    using Result = Validated<Value, Error>;

    Validating(Value initial, ValidatorType validator)
        : value_(std::move(initial)), validator_(std::move(validator)), result_(validator_.validate(value_)) {
        trace();
    }

    // Several validators are combined in order; every failure is reported.
    template <typename... Rest>
    Validating(Value initial, const ValidatorType& first, const ValidatorType& second, const Rest&... rest)
        : Validating(std::move(initial), ValidatorType::combine(first, second, rest...)) {}

    Validating(Value initial, std::vector<ValidatorType> validators)
        : Validating(std::move(initial), ValidatorType::combine(std::move(validators))) {}

    const Value& value() const { return value_; }
    const Result& result() const { return result_; }
    const ValidatorType& validator() const { return validator_; }

    bool isValid() const { return result_.isValid(); }

    // std::nullopt while the value is valid.
    std::optional<NonEmptyVector<Error>> errors() const { return result_.errors(); }

    void set(Value value) {
        value_ = std::move(value);
        revalidate();
    }

    Validating& operator=(Value value) {
        set(std::move(value));
        return *this;
    }

    // Mutates the value in place, then re-validates. If the mutator throws,
    // the cache is still brought up to date before the exception propagates.
    template <typename F>
    void update(F&& mutator) {
        try {
            std::forward<F>(mutator)(value_);
        } catch (...) {
            revalidate();
            throw;
        }
        revalidate();
    }

  private:
    void revalidate() {
        result_ = validator_.validate(value_);
        trace();
    }

    void trace() const {
        if (!debug::enabled()) return;
        if (result_.isValid()) {
            debug::log("validating: valid");
        } else {
            const auto& errors = result_.errorList();
            debug::log("validating: invalid, " + std::to_string(errors.size()) + " error(s)");
        }
    }

    Value value_;
    ValidatorType validator_;
    Result result_;
};

// Binding over an optional value. The required policy is fixed at
// construction: when required, absence fails with "is required", or with the
// caller's error when one is given (giving one implies required). Otherwise
// absence is valid and the validators are not consulted. Present values are
// always checked by every validator.
template <typename Value>
class OptionalValidating {
  public:
    using ValidatorType = Validator<Value>;
    using Result = Validated<std::optional<Value>, std::string>;

    template <typename... Rest>
    OptionalValidating(std::optional<Value> initial, const ValidatorType& first, const Rest&... rest)
        : OptionalValidating(std::move(initial), true, first, rest...) {}

    template <typename... Rest>
    OptionalValidating(std::optional<Value> initial, bool required, const ValidatorType& first, const Rest&... rest)
        : required_(required),
          binding_(std::move(initial), ValidatorType::combine(first, rest...).optional(!required)) {}

    template <typename... Rest>
    OptionalValidating(std::optional<Value> initial, std::string errorOnNil, const ValidatorType& first,
                       const Rest&... rest)
        : required_(true),
          binding_(std::move(initial),
                   ValidatorType::combine(first, rest...).optional(std::optional<std::string>(std::move(errorOnNil)))) {}

    // Keeps a string literal error from converting to the bool policy.
    template <typename... Rest>
    OptionalValidating(std::optional<Value> initial, const char* errorOnNil, const ValidatorType& first,
                       const Rest&... rest)
        : OptionalValidating(std::move(initial), std::string(errorOnNil), first, rest...) {}

    bool required() const { return required_; }

    const std::optional<Value>& value() const { return binding_.value(); }
    const Result& result() const { return binding_.result(); }
    bool isValid() const { return binding_.isValid(); }
    std::optional<NonEmptyVector<std::string>> errors() const { return binding_.errors(); }

    void set(std::optional<Value> value) { binding_.set(std::move(value)); }

    OptionalValidating& operator=(std::optional<Value> value) {
        binding_.set(std::move(value));
        return *this;
    }

    template <typename F>
    void update(F&& mutator) {
        binding_.update(std::forward<F>(mutator));
    }

  private:
    bool required_;
    Validating<std::optional<Value>> binding_;
};

}  // namespace va
