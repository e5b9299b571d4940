#include <shlit/testing/shlex.hpp>

#include <catch2/catch.hpp>

#define CHECK_SHLEX(str, ...)                                                                      \
    do {                                                                                           \
        INFO("Shell-lexing string: '" << str << "'");                                              \
        auto words = shlit::testing::split_shell_words(str);                                       \
        REQUIRE(words.has_value());                                                                \
        CHECK(*words == std::vector<std::string>(__VA_ARGS__));                                    \
    } while (0)

TEST_CASE("Shell lexer") {
    CHECK_SHLEX("foo", {"foo"});
    CHECK_SHLEX("foo bar", {"foo", "bar"});
    CHECK_SHLEX("\"foo\" bar", {"foo", "bar"});
    CHECK_SHLEX("\"foo bar\"", {"foo bar"});
    CHECK_SHLEX("", {});
    CHECK_SHLEX("   ", {});
    CHECK_SHLEX("\"\"", {""});
    CHECK_SHLEX("''", {""});
    CHECK_SHLEX("'quoted arg'", {"quoted arg"});
    CHECK_SHLEX("word     ", {"word"});
    CHECK_SHLEX("\"     meow\"", {"     meow"});
    CHECK_SHLEX("foo     bar", {"foo", "bar"});
    CHECK_SHLEX("Program\\ Files", {"Program Files"});
    CHECK_SHLEX("Foo\nBar", {"Foo", "Bar"});
    CHECK_SHLEX("foo \"\" bar", {"foo", "", "bar"});
    CHECK_SHLEX("'O'\\''Reilly'", {"O'Reilly"});
    CHECK_SHLEX("'a\\b'", {"a\\b"});
    CHECK_SHLEX("\"a\\b\"", {"a\\b"});
    CHECK_SHLEX("\"a\\\"b\"", {"a\"b"});
    CHECK_SHLEX("ab\\\ncd", {"abcd"});
    CHECK_SHLEX("pre'mid'post", {"premidpost"});
}

TEST_CASE("Shell lexer rejects incomplete input") {
    CHECK_FALSE(shlit::testing::split_shell_words("'open").has_value());
    CHECK_FALSE(shlit::testing::split_shell_words("\"open").has_value());
    CHECK_FALSE(shlit::testing::split_shell_words("trailing\\").has_value());
}

TEST_CASE("Read literal words") {
    using shlit::testing::read_literal_word;
    CHECK(read_literal_word("abc") == "abc");
    CHECK(read_literal_word("''") == "");
    CHECK(read_literal_word("'$HOME'") == "$HOME");
    CHECK(read_literal_word("a~b") == "a~b");
    CHECK(read_literal_word("''~") == "~");

    // More than one word
    CHECK_FALSE(read_literal_word("a b").has_value());
    CHECK_FALSE(read_literal_word("").has_value());
    // Subject to expansion
    CHECK_FALSE(read_literal_word("$HOME").has_value());
    CHECK_FALSE(read_literal_word("\"$HOME\"").has_value());
    CHECK_FALSE(read_literal_word("~user").has_value());
    CHECK_FALSE(read_literal_word("*.txt").has_value());
    CHECK_FALSE(read_literal_word("a;b").has_value());
}
