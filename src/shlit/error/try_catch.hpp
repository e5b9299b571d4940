#pragma once

#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/result.hpp>

#include <tuple>
#include <type_traits>
#include <utility>

namespace shlit {

template <typename Handler>
struct leaf_catch_block {
    Handler handler;
};

/**
 * @brief A try block and the catch blocks collected after it so far.
 *
 * If the try block returns a leaf::result, errors are handled with leaf::try_handle_all(),
 * otherwise exceptions are handled with leaf::try_catch(). Either way every error must be
 * handled, so the last catch block should accept anything.
 */
template <typename Try, typename... Handlers>
struct leaf_try_block {
    Try                     body;
    std::tuple<Handlers...> handlers;

    template <typename Handler>
    constexpr auto operator*(leaf_catch_block<Handler> blk) && {
        return leaf_try_block<Try, Handlers..., Handler>{
            std::move(body),
            std::tuple_cat(std::move(handlers), std::tuple<Handler>(std::move(blk.handler)))};
    }

    constexpr auto run() && {
        static_assert(sizeof...(Handlers) != 0,
                      "shlit_leaf_try requires one or more shlit_leaf_catch blocks");
        return std::apply(
            [&](auto&... hs) {
                if constexpr (boost::leaf::is_result_type<std::invoke_result_t<Try&>>::value) {
                    return boost::leaf::try_handle_all(body, hs...);
                } else {
                    return boost::leaf::try_catch(body, hs...);
                }
            },
            handlers);
    }
};

struct leaf_make_try_block {
    template <typename Func>
    constexpr auto operator->*(Func&& fn) const {
        return leaf_try_block<std::remove_cvref_t<Func>>{std::forward<Func>(fn), {}};
    }
};

struct leaf_make_catch_block {
    template <typename Func>
    constexpr auto operator->*(Func&& fn) const {
        return leaf_catch_block<std::remove_cvref_t<Func>>{std::forward<Func>(fn)};
    }
};

struct leaf_run_try_block {
    template <typename Try, typename... Handlers>
    constexpr auto operator+(leaf_try_block<Try, Handlers...>&& blk) const {
        return std::move(blk).run();
    }
};

}  // namespace shlit

/**
 * @brief Begin a Boost.LEAF try block. Follow it with one or more shlit_leaf_catch blocks and a
 * semicolon. The whole sequence is an expression yielding the value of the try block or of the
 * catch block that handled the error.
 *
 *      auto n = shlit_leaf_try { return parse(s); }
 *      shlit_leaf_catch(const shlit::arg_value_error& e) { return 0; }
 *      shlit_leaf_catch_all { return -1; };
 */
#define shlit_leaf_try ::shlit::leaf_run_try_block{} + ::shlit::leaf_make_try_block{}->*[&]()

#define shlit_leaf_catch *::shlit::leaf_make_catch_block{}->*[&]

#define shlit_leaf_catch_all                                                                       \
    shlit_leaf_catch(const ::boost::leaf::verbose_diagnostic_info& diagnostic_info [[maybe_unused]])
