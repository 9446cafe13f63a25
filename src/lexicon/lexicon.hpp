// src/lexicon/lexicon.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "lexicon/word_info.hpp"

namespace wk
{

    struct LexiconEntry
    {
        std::u32string reading;
        int16_t leftId;
        int16_t rightId;
        int16_t cost;
        std::string surface; // UTF-8
    };

    // In-memory word list keyed by reading.
    //
    // Mozc dictionary TSV:
    //   reading \t left_id \t right_id \t cost \t word
    // The POS id of a Mozc entry is its left_id (id.def numbering).
    class Lexicon : public WordInfoLookup
    {
    public:
        static Lexicon loadMozcTsv(const std::filesystem::path &path);

        void addMozcTsv(const std::filesystem::path &path);
        void addMozcTsv(std::istream &in, const std::string &name = "<stream>");

        int32_t add(LexiconEntry entry);

        size_t size() const { return entries_.size(); }
        size_t maxReadingLength() const { return maxReadingLength_; }

        const LexiconEntry &entry(int32_t wordId) const;

        // word ids whose reading equals `reading`, in insertion order
        const std::vector<int32_t> &lookup(const std::u32string &reading) const;

        const WordInfo &getWordInfo(int32_t wordId) const override;

        // throws std::runtime_error on the first entry whose left/right id
        // is not a row/column of a dim x dim connection matrix
        void checkConnectionIds(int dim) const;

    private:
        std::vector<LexiconEntry> entries_;
        std::vector<WordInfo> infos_;
        std::unordered_map<std::u32string, std::vector<int32_t>> index_;
        size_t maxReadingLength_ = 0;
    };

} // namespace wk
