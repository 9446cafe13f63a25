// src/grammar/grammar.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wk
{

    // leftId / rightId / cost of a BOS or EOS node.
    struct NodeParameter
    {
        int16_t leftId;
        int16_t rightId;
        int16_t cost;
    };

    // Grammar model consumed by the lattice.
    //
    // getConnectCost(leftId, rightId):
    //   leftId  = rightId of the preceding node
    //   rightId = leftId of the following node
    // INHIBITED_CONNECTION marks a pair that may never be adjacent.
    class Grammar
    {
    public:
        static constexpr int16_t INHIBITED_CONNECTION = 0x7fff;

        virtual ~Grammar() = default;

        virtual int16_t getConnectCost(int16_t leftId, int16_t rightId) const = 0;
        virtual NodeParameter getBOSParameter() const = 0;
        virtual NodeParameter getEOSParameter() const = 0;

        // debug view only
        virtual std::vector<std::string> getPartOfSpeechString(int16_t posId) const = 0;
    };

} // namespace wk
