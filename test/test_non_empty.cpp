#include <catch2/catch_test_macros.hpp>
#include <va/non_empty.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace va;

TEST_CASE("NonEmptyVector holds its head", "[non_empty][unit]") {
    NonEmptyVector<std::string> v("a");
    REQUIRE(v.size() == 1);
    REQUIRE(v.first() == "a");
    REQUIRE(v.last() == "a");
}

TEST_CASE("NonEmptyVector head and tail keep order", "[non_empty][unit]") {
    NonEmptyVector<int> v(1, {2, 3});
    REQUIRE(v.toVector() == std::vector<int>{1, 2, 3});
    REQUIRE(v[1] == 2);
    REQUIRE(v.last() == 3);
}

TEST_CASE("NonEmptyVector rejects an empty initializer list", "[non_empty][unit]") {
    REQUIRE_THROWS_AS(NonEmptyVector<int>(std::initializer_list<int>{}), std::invalid_argument);
    NonEmptyVector<int> v{4, 5};
    REQUIRE(v.size() == 2);
}

TEST_CASE("NonEmptyVector::fromVector", "[non_empty][unit]") {
    REQUIRE_FALSE(NonEmptyVector<int>::fromVector({}).has_value());

    auto v = NonEmptyVector<int>::fromVector({7, 8});
    REQUIRE(v.has_value());
    REQUIRE(v->first() == 7);
    REQUIRE(v->size() == 2);
}

TEST_CASE("NonEmptyVector append concatenates in order", "[non_empty][unit]") {
    NonEmptyVector<std::string> a{"a", "b"};
    NonEmptyVector<std::string> b{"c"};
    a.append(b);
    REQUIRE(a.toVector() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(b.size() == 1);
}

TEST_CASE("NonEmptyVector map and reduce", "[non_empty][unit]") {
    NonEmptyVector<int> v{1, 2, 3};

    auto doubled = v.map([](int x) { return x * 2; });
    REQUIRE(doubled.toVector() == std::vector<int>{2, 4, 6});

    auto text = v.map([](int x) { return std::to_string(x); });
    REQUIRE(text.first() == "1");

    int sum = v.reduce(0, [](int acc, int x) { return acc + x; });
    REQUIRE(sum == 6);
}

TEST_CASE("NonEmptyVector equality", "[non_empty][unit]") {
    REQUIRE(NonEmptyVector<int>{1, 2} == NonEmptyVector<int>{1, 2});
    REQUIRE(NonEmptyVector<int>{1, 2} != NonEmptyVector<int>{2, 1});
}
