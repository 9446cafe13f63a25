// src/lattice/lattice_node.hpp
#pragma once

#include <cstdint>
#include <limits>

#include "grammar/grammar.hpp"

namespace wk
{

    // Handle of a node inside the arena of the Lattice that owns it.
    using NodeId = uint32_t;
    inline constexpr NodeId NO_NODE = std::numeric_limits<NodeId>::max();

    struct LatticeNode
    {
        int begin; // [begin, end) in code points
        int end;

        int16_t leftId;
        int16_t rightId;
        int16_t cost; // emission cost

        int32_t wordId; // -1 for BOS/EOS
        bool isDefined; // false for BOS/EOS

        // DP state. Written by Lattice only, reset on insert.
        int64_t totalCost;         // best cost from BOS, including this node's cost
        NodeId bestPreviousNode;   // back-reference into the same lattice
        bool isConnectedToBOS;

        LatticeNode();
        LatticeNode(int16_t leftId_, int16_t rightId_, int16_t cost_, int32_t wordId_);

        void setParameter(int16_t leftId_, int16_t rightId_, int16_t cost_);
        void setParameter(const NodeParameter &p);
        void setWordId(int32_t wordId_);

        void resetConnection();
    };

} // namespace wk
