#include "./try_catch.hpp"

#include <shlit/error/errors.hpp>
#include <shlit/format.hpp>

#include <boost/leaf/pred.hpp>
#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

using namespace std::literals;

TEST_CASE("A try block without an error yields its own value") {
    auto r = shlit_leaf_try { return 2; }
    shlit_leaf_catch_all->int { return 0; };
    CHECK(r == 2);
}

TEST_CASE("Catch an exception by type") {
    auto caught = shlit_leaf_try->shlit::errc {
        shlit::format_argument("tab\0"sv);
        return shlit::errc::none;
    }
    shlit_leaf_catch(const shlit::arg_type_error& e) { return e.code(); }
    shlit_leaf_catch(const shlit::arg_value_error& e) { return e.code(); }
    shlit_leaf_catch_all {
        FAIL_CHECK("Incorrect error: " << diagnostic_info);
        return shlit::errc::none;
    };
    CHECK(caught == shlit::errc::arg_contains_nul);
}

TEST_CASE("The first matching catch block handles the error") {
    int which = 0;
    shlit_leaf_try { throw shlit::arg_type_error(); }
    shlit_leaf_catch(const std::runtime_error&) { which = 1; }
    shlit_leaf_catch(const shlit::arg_type_error&) { which = 2; }
    shlit_leaf_catch_all { which = 3; };
    CHECK(which == 1);
}

TEST_CASE("Handle errors from a result") {
    auto formatted = shlit_leaf_try { return shlit::try_format_argument("\xff"sv); }
    shlit_leaf_catch(boost::leaf::match<shlit::errc, shlit::errc::arg_not_text>,
                     shlit::e_invalid_utf8 bad)
        ->std::string { return "<not text at " + std::to_string(bad.offset) + ">"; }
    shlit_leaf_catch_all->std::string { return "<other>"; };
    CHECK(formatted == "<not text at 0>");

    auto ok = shlit_leaf_try { return shlit::try_format_argument("a;b"); }
    shlit_leaf_catch_all->std::string { return "<error>"; };
    CHECK(ok == "'a;b'");
}
