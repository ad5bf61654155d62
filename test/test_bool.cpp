#include <catch2/catch_test_macros.hpp>
#include <va/builtin/bool.h>

using namespace va;

TEST_CASE("isTrue", "[builtin][bool][unit]") {
    REQUIRE(isTrue().validate(true).isValid());
    REQUIRE_FALSE(isTrue().validate(false).isValid());
    REQUIRE(isTrue().validate(false).errorList().first() == "must be true");
}

TEST_CASE("isFalse", "[builtin][bool][unit]") {
    REQUIRE(isFalse().validate(false).isValid());
    REQUIRE_FALSE(isFalse().validate(true).isValid());
    REQUIRE(isFalse().validate(true).errorList().first() == "must be false");
}
