// src/lattice/lattice.hpp
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "grammar/grammar.hpp"
#include "lattice/lattice_node.hpp"

namespace wk
{

    // Thrown by getBestPath() when EOS has no connected predecessor.
    class EosNotConnectedError : public std::runtime_error
    {
    public:
        explicit EosNotConnectedError(const std::string &what) : std::runtime_error(what) {}
    };

    // Word lattice with incremental Viterbi relaxation.
    //
    // endLists_[end] = ids of nodes whose end position is `end`
    // endLists_[0]   = { BOS }
    //
    // Usage per analysis:
    //   resize(n) -> insert(...)* -> remove(...)* -> connectEosNode() -> getBestPath() -> clear()
    //
    // Nodes must be inserted left to right: every node ending at `b` has to be
    // inserted before any node beginning at `b`. This is not checked.
    //
    // The lattice owns every node. NodeId handles stay valid until clear();
    // references returned by node() may be invalidated by the next insert().
    class Lattice
    {
    public:
        // totalCost of a node with no connected predecessor. Never compared
        // against; reachability is isConnectedToBOS.
        static constexpr int64_t INFINITE_COST = std::numeric_limits<int64_t>::max() / 2;
        static constexpr NodeId BOS_NODE = 0;

        // grammar must outlive the lattice
        explicit Lattice(const Grammar &grammar);

        void resize(int size);
        void clear();

        int size() const { return size_; }
        int capacity() const { return capacity_; }

        NodeId insert(int begin, int end, const LatticeNode &node);
        void remove(int begin, int end, NodeId id);
        void connectEosNode();

        const std::vector<NodeId> &getNodesWithEnd(int end) const;
        std::vector<NodeId> getNodes(int begin, int end) const;
        std::optional<NodeId> getMinimumNode(int begin, int end) const;
        bool hasPreviousNode(int index) const;

        std::vector<NodeId> getBestPath() const;

        const LatticeNode &node(NodeId id) const;
        NodeId bosNode() const { return BOS_NODE; }
        NodeId eosNode() const { return eosNode_; }
        const Grammar &grammar() const { return grammar_; }

    private:
        void expand(int newCapacity);
        void connectNode(NodeId rId);
        const std::vector<NodeId> &endList(int end) const;

        const Grammar &grammar_;
        NodeParameter eosParams_;

        std::vector<LatticeNode> nodes_; // arena; nodes_[0] is BOS
        std::vector<std::vector<NodeId>> endLists_;

        int size_;
        int capacity_;
        NodeId eosNode_;
    };

} // namespace wk
