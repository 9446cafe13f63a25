// src/common/utf8.hpp
#pragma once

#include <string>
#include <string_view>

namespace wk
{

    // strict UTF-8 decode; false on malformed input or surrogates
    bool utf8_to_u32(std::string_view s, std::u32string &out);

    void append_utf8(std::string &out, char32_t cp);
    std::string u32_to_utf8(std::u32string_view s);

} // namespace wk
