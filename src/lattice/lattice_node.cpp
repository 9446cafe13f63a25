// src/lattice/lattice_node.cpp
#include "lattice/lattice_node.hpp"

namespace wk
{

    LatticeNode::LatticeNode()
        : begin(0),
          end(0),
          leftId(0),
          rightId(0),
          cost(0),
          wordId(-1),
          isDefined(false),
          totalCost(0),
          bestPreviousNode(NO_NODE),
          isConnectedToBOS(false)
    {
    }

    LatticeNode::LatticeNode(int16_t leftId_, int16_t rightId_, int16_t cost_, int32_t wordId_)
        : LatticeNode()
    {
        setParameter(leftId_, rightId_, cost_);
        setWordId(wordId_);
    }

    void LatticeNode::setParameter(int16_t leftId_, int16_t rightId_, int16_t cost_)
    {
        leftId = leftId_;
        rightId = rightId_;
        cost = cost_;
    }

    void LatticeNode::setParameter(const NodeParameter &p)
    {
        setParameter(p.leftId, p.rightId, p.cost);
    }

    void LatticeNode::setWordId(int32_t wordId_)
    {
        wordId = wordId_;
        isDefined = true;
    }

    void LatticeNode::resetConnection()
    {
        totalCost = 0;
        bestPreviousNode = NO_NODE;
        isConnectedToBOS = false;
    }

} // namespace wk
