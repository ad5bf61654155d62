#include <catch2/catch_test_macros.hpp>
#include <va/builtin/element.h>

#include <set>
#include <string>
#include <unordered_set>
#include <vector>

using namespace va;

using Errors = std::vector<std::string>;

TEST_CASE("isIncluded in a list", "[builtin][element][unit]") {
    auto v = isIncluded({1, 2, 3});
    REQUIRE(v.validate(3).isValid());
    REQUIRE(v.validate(4).errorList().toVector() == Errors{"must be included in [1, 2, 3]"});
}

TEST_CASE("isIncluded in a set", "[builtin][element][unit]") {
    auto v = isIncluded(std::set<int>{1, 2, 3});
    REQUIRE(v.validate(3).isValid());
    REQUIRE(v.validate(4).errorList().toVector() == Errors{"must be included in set"});

    auto hashed = isIncluded(std::unordered_set<int>{1, 2, 3});
    REQUIRE(hashed.validate(1).isValid());
    REQUIRE(hashed.validate(0).errorList().first() == "must be included in set");
}

TEST_CASE("isExcluded from a list", "[builtin][element][unit]") {
    auto v = isExcluded({1, 2, 3});
    REQUIRE(v.validate(4).isValid());
    REQUIRE(v.validate(3).errorList().toVector() == Errors{"must be excluded from [1, 2, 3]"});
}

TEST_CASE("isExcluded from a set", "[builtin][element][unit]") {
    auto v = isExcluded(std::set<int>{1, 2, 3});
    REQUIRE(v.validate(4).isValid());
    REQUIRE(v.validate(3).errorList().toVector() == Errors{"must be excluded from set"});
}

TEST_CASE("string lists are quoted in errors", "[builtin][element][unit]") {
    auto v = isIncluded(std::vector<std::string>{"red", "green"});
    REQUIRE(v.validate("red").isValid());
    REQUIRE(v.validate("blue").errorList().first() == "must be included in [\"red\", \"green\"]");
}
