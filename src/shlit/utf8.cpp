#include "./utf8.hpp"

std::optional<std::size_t> shlit::utf8::find_ill_formed(std::string_view s) noexcept {
    const auto  bytes = reinterpret_cast<const std::uint8_t*>(s.data());
    std::size_t idx   = 0;
    while (idx != s.size()) {
        const auto seq_start = idx;
        UChar32    cp        = 0;
        U8_NEXT(bytes, idx, s.size(), cp);
        if (cp < 0) {
            return seq_start;
        }
    }
    return std::nullopt;
}
