// src/lexicon/word_info.hpp
#pragma once

#include <cstdint>
#include <string>

namespace wk
{

    struct WordInfo
    {
        std::string surface; // UTF-8
        int16_t posId;       // -1 if unknown
    };

    // word id -> WordInfo (used by the debug views)
    class WordInfoLookup
    {
    public:
        virtual ~WordInfoLookup() = default;
        virtual const WordInfo &getWordInfo(int32_t wordId) const = 0;
    };

} // namespace wk
