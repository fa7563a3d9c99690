#include <catch2/catch_test_macros.hpp>
#include "minischeme/lexical.h"
#include "minischeme/error.h"

using namespace minischeme;

TEST_CASE("Lexical numeric literals", "[lexical]") {
    CHECK(isNumericLiteral("2"));
    CHECK(isNumericLiteral("75.603"));
    CHECK(isNumericLiteral(".5"));
    CHECK(isNumericLiteral("5."));
    CHECK(isNumericLiteral("007"));
}

TEST_CASE("Lexical non-numeric literals", "[lexical]") {
    CHECK_FALSE(isNumericLiteral(""));
    CHECK_FALSE(isNumericLiteral("."));
    CHECK_FALSE(isNumericLiteral("a"));
    CHECK_FALSE(isNumericLiteral("2a"));
    CHECK_FALSE(isNumericLiteral("2.B"));
    CHECK_FALSE(isNumericLiteral("3.4.5"));
    CHECK_FALSE(isNumericLiteral("-3"));
    CHECK_FALSE(isNumericLiteral("+"));
}

TEST_CASE("Lexical string literals", "[lexical]") {
    CHECK(isStringLiteral("\"hello\""));
    CHECK(isStringLiteral("\"\""));
    CHECK_FALSE(isStringLiteral("\"incomplete"));
    CHECK_FALSE(isStringLiteral("\""));
    CHECK_FALSE(isStringLiteral("2"));
    CHECK_FALSE(isStringLiteral("a"));
    CHECK_FALSE(isStringLiteral(""));
}

TEST_CASE("Lexical primitives", "[lexical]") {
    CHECK(isPrimitive(""));
    CHECK(isPrimitive("12"));
    CHECK(isPrimitive("\"x\""));
    CHECK_FALSE(isPrimitive("x"));
    CHECK_FALSE(isPrimitive("+"));
}

TEST_CASE("Lexical variable names", "[lexical]") {
    CHECK(isValidVariableName("a"));
    CHECK(isValidVariableName("asd5"));
    CHECK(isValidVariableName("5_a"));
    CHECK(isValidVariableName("under_score"));

    CHECK_FALSE(isValidVariableName("?"));
    CHECK_FALSE(isValidVariableName("(a"));
    CHECK_FALSE(isValidVariableName("a-b"));
    CHECK_FALSE(isValidVariableName("\"a\""));
}

TEST_CASE("Lexical reserved symbols are not variable names", "[lexical]") {
    CHECK_FALSE(isValidVariableName("define"));
    CHECK_FALSE(isValidVariableName("+"));
    CHECK_FALSE(isValidVariableName("-"));
    CHECK_FALSE(isValidVariableName("*"));
}

TEST_CASE("Lexical numeric literal evaluation", "[lexical]") {
    Value i = evalNumericLiteral("23");
    REQUIRE(i.isInt());
    CHECK(i.asInt() == 23);

    Value f = evalNumericLiteral("2.3");
    REQUIRE(f.isFloat());
    CHECK(f.asFloat() == 2.3);

    Value g = evalNumericLiteral("4.");
    REQUIRE(g.isFloat());
    CHECK(g.asFloat() == 4.0);
}

TEST_CASE("Lexical numeric literal errors", "[lexical]") {
    CHECK_THROWS_AS(evalNumericLiteral("abc"), SyntaxError);
    CHECK_THROWS_AS(evalNumericLiteral("99999999999999999999999"), SyntaxError);
}

TEST_CASE("Lexical string literal evaluation", "[lexical]") {
    CHECK(evalStringLiteral("\"bob\"").asString() == "bob");
    CHECK(evalStringLiteral("\"\"").asString() == "");
    // No escape processing
    CHECK(evalStringLiteral("\"a\\nb\"").asString() == "a\\nb");
    CHECK_THROWS_AS(evalStringLiteral("bob"), SyntaxError);
}

TEST_CASE("Lexical primitive evaluation", "[lexical]") {
    CHECK(evalPrimitive("").isUnit());
    CHECK(evalPrimitive("23").asInt() == 23);
    CHECK(evalPrimitive("2.3").asFloat() == 2.3);
    CHECK(evalPrimitive("\"bob\"").asString() == "bob");
    CHECK_THROWS_AS(evalPrimitive("jim"), SyntaxError);
}
