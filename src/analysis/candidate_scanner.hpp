// src/analysis/candidate_scanner.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "lattice/lattice.hpp"
#include "lexicon/lexicon.hpp"
#include "lexicon/word_info.hpp"

namespace wk
{

    struct UnknownWordParameter
    {
        int16_t leftId = 0;
        int16_t rightId = 0;
        int16_t cost = 10000;
    };

    // Proposes candidate nodes for an input by exact reading lookup.
    //
    // At every reachable position the scanner inserts each lexicon entry whose
    // reading starts there. Positions without any entry get a 1-char unknown
    // word. Unknown words get ids >= lexicon.size(), resolved by this object
    // until the next build()/reset().
    class CandidateScanner : public WordInfoLookup
    {
    public:
        explicit CandidateScanner(const Lexicon &lexicon, UnknownWordParameter unk = UnknownWordParameter());

        // lattice must be cleared (or fresh). Leaves EOS connected.
        void build(Lattice &lattice, std::string_view utf8);
        void build(Lattice &lattice, const std::u32string &text);

        void reset();

        const WordInfo &getWordInfo(int32_t wordId) const override;

        size_t unknownCount() const { return unknown_.size(); }

    private:
        // same span, ids and surface: keep the cheaper node
        void insertOrReplace(Lattice &lattice, int begin, int end, const LatticeNode &node);

        const Lexicon &lexicon_;
        UnknownWordParameter unk_;
        std::vector<WordInfo> unknown_;
    };

} // namespace wk
