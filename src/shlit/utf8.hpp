#pragma once

#include <unicode/utf8.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace shlit::utf8 {

/**
 * @brief Find the first ill-formed UTF-8 sequence in the given byte string.
 *
 * @return The byte offset at which the ill-formed sequence begins, or nullopt if the whole string
 * is well-formed UTF-8.
 */
std::optional<std::size_t> find_ill_formed(std::string_view s) noexcept;

inline bool is_well_formed(std::string_view s) noexcept { return !find_ill_formed(s).has_value(); }

/**
 * @brief Decode the code points of `s` in order and return `true` as soon as `pred` returns
 * `true` for one of them.
 *
 * Ill-formed sequences are skipped.
 */
template <typename Pred>
bool any_code_point(std::string_view s, Pred&& pred) noexcept(noexcept(pred(char32_t{}))) {
    const auto  bytes = reinterpret_cast<const std::uint8_t*>(s.data());
    std::size_t idx   = 0;
    while (idx != s.size()) {
        UChar32 cp = 0;
        U8_NEXT(bytes, idx, s.size(), cp);
        if (cp < 0) {
            continue;
        }
        if (pred(static_cast<char32_t>(cp))) {
            return true;
        }
    }
    return false;
}

}  // namespace shlit::utf8
