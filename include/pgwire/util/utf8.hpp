#ifndef PGWIRE_UTIL_UTF8_HPP
#define PGWIRE_UTIL_UTF8_HPP

#include <cstddef>
#include <string_view>

namespace pgwire::util {

// strict check: rejects overlong forms, surrogates and code points above U+10FFFF
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

// first code point of text, which must be non-empty valid UTF-8. length gets its byte count
[[nodiscard]] char32_t first_code_point(std::string_view text, std::size_t& length) noexcept;

}  // namespace pgwire::util

#endif
