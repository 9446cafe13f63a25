// src/common/utf8.cpp
#include "common/utf8.hpp"

namespace wk
{

    static bool utf8_next_codepoint(std::string_view s, size_t &i, char32_t &out_cp)
    {
        if (i >= s.size())
            return false;
        const unsigned char c0 = static_cast<unsigned char>(s[i]);

        if (c0 < 0x80)
        {
            out_cp = c0;
            ++i;
            return true;
        }

        if ((c0 & 0xE0) == 0xC0)
        {
            if (i + 1 >= s.size())
                return false;
            const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            if ((c1 & 0xC0) != 0x80)
                return false;
            char32_t cp = (c0 & 0x1F);
            cp = (cp << 6) | (c1 & 0x3F);
            if (cp < 0x80)
                return false;
            out_cp = cp;
            i += 2;
            return true;
        }

        if ((c0 & 0xF0) == 0xE0)
        {
            if (i + 2 >= s.size())
                return false;
            const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            const unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
            if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80)
                return false;
            char32_t cp = (c0 & 0x0F);
            cp = (cp << 6) | (c1 & 0x3F);
            cp = (cp << 6) | (c2 & 0x3F);
            if (cp < 0x800)
                return false;
            if (cp >= 0xD800 && cp <= 0xDFFF)
                return false;
            out_cp = cp;
            i += 3;
            return true;
        }

        if ((c0 & 0xF8) == 0xF0)
        {
            if (i + 3 >= s.size())
                return false;
            const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            const unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
            const unsigned char c3 = static_cast<unsigned char>(s[i + 3]);
            if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80)
                return false;
            char32_t cp = (c0 & 0x07);
            cp = (cp << 6) | (c1 & 0x3F);
            cp = (cp << 6) | (c2 & 0x3F);
            cp = (cp << 6) | (c3 & 0x3F);
            if (cp < 0x10000)
                return false;
            if (cp > 0x10FFFF)
                return false;
            out_cp = cp;
            i += 4;
            return true;
        }

        return false;
    }

    bool utf8_to_u32(std::string_view s, std::u32string &out)
    {
        out.clear();
        out.reserve(s.size());

        size_t i = 0;
        while (i < s.size())
        {
            char32_t cp = 0;
            if (!utf8_next_codepoint(s, i, cp))
                return false;
            out.push_back(cp);
        }
        return true;
    }

    void append_utf8(std::string &out, char32_t cp)
    {
        if (cp <= 0x7F)
            out.push_back(static_cast<char>(cp));
        else if (cp <= 0x7FF)
        {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp <= 0xFFFF)
        {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string u32_to_utf8(std::u32string_view s)
    {
        std::string out;
        out.reserve(s.size() * 3);
        for (char32_t cp : s)
            append_utf8(out, cp);
        return out;
    }

} // namespace wk
