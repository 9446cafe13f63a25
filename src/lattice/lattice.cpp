// src/lattice/lattice.cpp
#include "lattice/lattice.hpp"

#include <algorithm>

namespace wk
{

    Lattice::Lattice(const Grammar &grammar)
        : grammar_(grammar),
          eosParams_(grammar.getEOSParameter()),
          size_(0),
          capacity_(0),
          eosNode_(NO_NODE)
    {
        LatticeNode bos;
        bos.setParameter(grammar.getBOSParameter());
        bos.isConnectedToBOS = true;
        bos.totalCost = bos.cost;

        nodes_.push_back(bos);
        endLists_.push_back({BOS_NODE});
    }

    // -----------------------------
    // capacity / lifecycle
    // -----------------------------
    void Lattice::resize(int size)
    {
        if (size < 0)
            throw std::invalid_argument("Lattice: negative size: " + std::to_string(size));

        if (size > capacity_)
            expand(size);

        // shrinking inside an analysis: drop what clear() would no longer reach
        for (int i = size + 1; i <= size_; ++i)
            endLists_[static_cast<size_t>(i)].clear();

        size_ = size;

        LatticeNode eos;
        eos.setParameter(eosParams_);
        eos.begin = eos.end = size;

        eosNode_ = static_cast<NodeId>(nodes_.size());
        nodes_.push_back(eos);
    }

    void Lattice::clear()
    {
        for (int i = 1; i <= size_; ++i)
            endLists_[static_cast<size_t>(i)].clear();

        nodes_.erase(nodes_.begin() + 1, nodes_.end());
        size_ = 0;
        eosNode_ = NO_NODE;
    }

    void Lattice::expand(int newCapacity)
    {
        endLists_.reserve(static_cast<size_t>(newCapacity) + 1);
        while (endLists_.size() < static_cast<size_t>(newCapacity) + 1)
            endLists_.emplace_back();
        capacity_ = newCapacity;
    }

    // -----------------------------
    // insertion / relaxation
    // -----------------------------
    NodeId Lattice::insert(int begin, int end, const LatticeNode &node)
    {
        if (end < 0 || end > size_)
        {
            throw std::out_of_range("Lattice: end out of range: " + std::to_string(end) +
                                    " (size=" + std::to_string(size_) + ")");
        }
        if (begin < 0 || begin > end)
        {
            throw std::invalid_argument("Lattice: invalid span [" + std::to_string(begin) +
                                        ", " + std::to_string(end) + ")");
        }

        const NodeId id = static_cast<NodeId>(nodes_.size());
        nodes_.push_back(node);

        LatticeNode &n = nodes_.back();
        n.begin = begin;
        n.end = end;
        n.resetConnection();

        endLists_[static_cast<size_t>(end)].push_back(id);
        connectNode(id);
        return id;
    }

    void Lattice::remove(int begin, int end, NodeId id)
    {
        const LatticeNode &n = node(id);
        if (n.begin != begin || n.end != end)
        {
            throw std::invalid_argument("Lattice: node " + std::to_string(id) + " does not span [" +
                                        std::to_string(begin) + ", " + std::to_string(end) + ")");
        }
        if (id == BOS_NODE)
            throw std::invalid_argument("Lattice: BOS cannot be removed");

        auto &nodes = endLists_[static_cast<size_t>(end)];
        const auto it = std::find(nodes.begin(), nodes.end(), id);
        if (it != nodes.end())
            nodes.erase(it);
    }

    void Lattice::connectNode(NodeId rId)
    {
        LatticeNode &rNode = nodes_[rId];
        rNode.totalCost = INFINITE_COST;
        rNode.bestPreviousNode = NO_NODE;

        for (NodeId lId : endLists_[static_cast<size_t>(rNode.begin)])
        {
            if (lId == rId)
                continue; // zero-width node in its own start bucket

            const LatticeNode &lNode = nodes_[lId];
            if (!lNode.isConnectedToBOS)
                continue;

            const int16_t connectCost = grammar_.getConnectCost(lNode.rightId, rNode.leftId);
            if (connectCost == Grammar::INHIBITED_CONNECTION)
                continue; // this connection is not allowed

            const int64_t cost = lNode.totalCost + connectCost;
            if (rNode.bestPreviousNode == NO_NODE || cost < rNode.totalCost)
            {
                rNode.totalCost = cost;
                rNode.bestPreviousNode = lId;
            }
        }

        rNode.isConnectedToBOS = (rNode.bestPreviousNode != NO_NODE);
        rNode.totalCost += rNode.cost;
    }

    void Lattice::connectEosNode()
    {
        if (eosNode_ == NO_NODE)
            throw std::logic_error("Lattice: connectEosNode() called before resize()");
        connectNode(eosNode_);
    }

    // -----------------------------
    // queries
    // -----------------------------
    const std::vector<NodeId> &Lattice::endList(int end) const
    {
        if (end < 0 || end > capacity_)
        {
            throw std::out_of_range("Lattice: end out of range: " + std::to_string(end) +
                                    " (capacity=" + std::to_string(capacity_) + ")");
        }
        return endLists_[static_cast<size_t>(end)];
    }

    const std::vector<NodeId> &Lattice::getNodesWithEnd(int end) const
    {
        return endList(end);
    }

    std::vector<NodeId> Lattice::getNodes(int begin, int end) const
    {
        std::vector<NodeId> out;
        for (NodeId id : endList(end))
        {
            if (nodes_[id].begin == begin)
                out.push_back(id);
        }
        return out;
    }

    std::optional<NodeId> Lattice::getMinimumNode(int begin, int end) const
    {
        std::optional<NodeId> best;
        for (NodeId id : endList(end))
        {
            const LatticeNode &n = nodes_[id];
            if (n.begin != begin)
                continue;
            if (!best || n.cost < nodes_[*best].cost)
                best = id;
        }
        return best;
    }

    bool Lattice::hasPreviousNode(int index) const
    {
        return !endList(index).empty();
    }

    const LatticeNode &Lattice::node(NodeId id) const
    {
        if (id >= nodes_.size())
            throw std::out_of_range("Lattice: unknown node id: " + std::to_string(id));
        return nodes_[id];
    }

    // -----------------------------
    // best path
    // -----------------------------
    std::vector<NodeId> Lattice::getBestPath() const
    {
        if (eosNode_ == NO_NODE || !nodes_[eosNode_].isConnectedToBOS)
            throw EosNotConnectedError("EOS isn't connected to BOS");

        std::vector<NodeId> result;
        for (NodeId id = nodes_[eosNode_].bestPreviousNode; id != BOS_NODE; id = nodes_[id].bestPreviousNode)
            result.push_back(id);

        std::reverse(result.begin(), result.end());
        return result;
    }

} // namespace wk
