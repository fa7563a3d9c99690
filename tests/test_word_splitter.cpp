#include <catch2/catch_test_macros.hpp>
#include "minischeme/word_splitter.h"
#include "minischeme/error.h"

using namespace minischeme;

using Words = std::vector<std::string>;

// Join words with single spaces
static std::string join(const Words& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

// ---- splitWords ----

TEST_CASE("Splitter empty input yields one empty word", "[splitter]") {
    CHECK(splitWords("") == Words{""});
}

TEST_CASE("Splitter whitespace only yields no words", "[splitter]") {
    CHECK(splitWords("   \t ").empty());
}

TEST_CASE("Splitter single atoms", "[splitter]") {
    CHECK(splitWords("2") == Words{"2"});
    CHECK(splitWords("abc") == Words{"abc"});
    CHECK(splitWords("  abc  ") == Words{"abc"});
}

TEST_CASE("Splitter bare words", "[splitter]") {
    CHECK(splitWords("2 4 5") == Words{"2", "4", "5"});
    CHECK(splitWords("+ a\t\"s\"\n7") == Words{"+", "a", "\"s\"", "7"});
}

TEST_CASE("Splitter keeps groups whole", "[splitter]") {
    CHECK(splitWords("( 2)") == Words{"( 2)"});
    CHECK(splitWords("2 (+ 4 4)") == Words{"2", "(+ 4 4)"});
    CHECK(splitWords("((4))") == Words{"((4))"});
    CHECK(splitWords("define (double x) (* x 2)") ==
          Words{"define", "(double x)", "(* x 2)"});
}

TEST_CASE("Splitter group after atom without space", "[splitter]") {
    CHECK(splitWords("a(b c)") == Words{"a", "(b c)"});
}

TEST_CASE("Splitter rejects unbalanced parentheses", "[splitter]") {
    CHECK_THROWS_AS(splitWords("("), SyntaxError);
    CHECK_THROWS_AS(splitWords(")"), SyntaxError);
    CHECK_THROWS_AS(splitWords("(+ 1 2"), SyntaxError);
    CHECK_THROWS_AS(splitWords("+ 1 2)"), SyntaxError);
    CHECK_THROWS_AS(splitWords("())("), SyntaxError);
}

TEST_CASE("Splitter rejects glued groups", "[splitter]") {
    CHECK_THROWS_AS(splitWords("()(2"), SyntaxError);
    CHECK_THROWS_AS(splitWords("(a)(b)"), SyntaxError);
    CHECK_THROWS_AS(splitWords("(a)b"), SyntaxError);
}

TEST_CASE("Splitter words rejoin to an equivalent expression", "[splitter]") {
    std::string source = "2   (+ 4  (* 1 2))\tb";
    auto words = splitWords(source);
    CHECK(join(words) == "2 (+ 4  (* 1 2)) b");
    CHECK(splitWords(join(words)) == words);
}

// ---- stripParens ----

TEST_CASE("Strip removes one enclosing pair", "[splitter][strip]") {
    CHECK(stripParens("(+ 2 5)") == "+ 2 5");
    CHECK(stripParens("(( 4 ) )") == "( 4 ) ");
    CHECK(stripParens("()") == "");
}

TEST_CASE("Strip is textual, not depth-aware", "[splitter][strip]") {
    CHECK(stripParens("x (a) y (b) z") == "a) y (b");
    CHECK(stripParens(")(") == "");
}

TEST_CASE("Strip requires both parentheses", "[splitter][strip]") {
    CHECK_THROWS_AS(stripParens("+ 2 5)"), SyntaxError);
    CHECK_THROWS_AS(stripParens("("), SyntaxError);
    CHECK_THROWS_AS(stripParens(""), SyntaxError);
}

// ---- helpers ----

TEST_CASE("Compound form detection", "[splitter]") {
    CHECK(isCompound("(a)"));
    CHECK(isCompound("()"));
    CHECK_FALSE(isCompound(""));
    CHECK_FALSE(isCompound("(a"));
    CHECK_FALSE(isCompound("a)"));

    CHECK(isPotentialCompound("(a )"));
    CHECK(isPotentialCompound("x ( y ) z"));
    CHECK_FALSE(isPotentialCompound(""));
    CHECK_FALSE(isPotentialCompound("( a"));
}

TEST_CASE("Find forward and backward", "[splitter]") {
    std::string_view text = "aabdowm";
    CHECK(findForward(text, 'b') == 2u);
    CHECK(findForward(text, 'a') == 0u);
    CHECK(findBackward(text, 'a') == 1u);
    CHECK(findBackward(text, 'd') == 3u);
    CHECK_FALSE(findForward(text, 'z').has_value());
    CHECK_FALSE(findBackward(text, 'z').has_value());
}
