// src/lattice/lattice_dump.hpp
#pragma once

#include <ostream>
#include <string>

#include "lattice/lattice.hpp"
#include "lexicon/word_info.hpp"

namespace wk
{

    // Debug views of the active analysis. Nothing here feeds back into the lattice.
    //
    // Text, EOS first and then by descending end position, one line per node:
    //   <index>: <begin> <end> <surface>(<wordId>) <pos> <leftId> <rightId> <cost>: <connect> <connect> ...
    // where the connect costs are to every node ending at <begin>.
    void dumpLattice(const Lattice &lattice, const WordInfoLookup &words, std::ostream &os);

    // JSON array, BOS first and EOS last. Keys per node:
    //   begin (null for BOS), end (null for EOS), headword, wordId, pos,
    //   leftId, rightId, cost, nodeId, connectCosts
    std::string latticeToJson(const Lattice &lattice, const WordInfoLookup &words);

    std::string nodeSurface(const LatticeNode &node, const WordInfoLookup &words);
    std::string nodePos(const LatticeNode &node, const Grammar &grammar, const WordInfoLookup &words);

} // namespace wk
