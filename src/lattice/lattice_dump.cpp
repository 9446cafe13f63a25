// src/lattice/lattice_dump.cpp
#include "lattice/lattice_dump.hpp"

#include <iterator>
#include <stdexcept>
#include <vector>

#include <boost/spirit/include/karma.hpp>

#include "common/json_string_generator.hpp"

namespace wk
{

    std::string nodeSurface(const LatticeNode &node, const WordInfoLookup &words)
    {
        return node.isDefined ? words.getWordInfo(node.wordId).surface : "(null)";
    }

    std::string nodePos(const LatticeNode &node, const Grammar &grammar, const WordInfoLookup &words)
    {
        if (!node.isDefined)
            return "BOS/EOS";

        const int16_t posId = words.getWordInfo(node.wordId).posId;
        if (posId < 0)
            return "(null)";

        std::string out;
        const auto labels = grammar.getPartOfSpeechString(posId);
        for (size_t i = 0; i < labels.size(); ++i)
        {
            if (i > 0)
                out += ',';
            out += labels[i];
        }
        return out;
    }

    // end buckets 0..size, then EOS
    static std::vector<NodeId> collect_nodes(const Lattice &lattice)
    {
        if (lattice.eosNode() == NO_NODE)
            throw std::logic_error("Lattice: no active analysis (call resize() first)");

        std::vector<NodeId> out;
        for (int i = 0; i <= lattice.size(); ++i)
        {
            const auto &bucket = lattice.getNodesWithEnd(i);
            out.insert(out.end(), bucket.begin(), bucket.end());
        }
        out.push_back(lattice.eosNode());
        return out;
    }

    void dumpLattice(const Lattice &lattice, const WordInfoLookup &words, std::ostream &os)
    {
        const Grammar &grammar = lattice.grammar();
        if (lattice.eosNode() == NO_NODE)
            throw std::logic_error("Lattice: no active analysis (call resize() first)");

        // EOS, then buckets from the end; insertion order within a bucket
        std::vector<NodeId> ids{lattice.eosNode()};
        for (int i = lattice.size(); i >= 0; --i)
        {
            const auto &bucket = lattice.getNodesWithEnd(i);
            ids.insert(ids.end(), bucket.begin(), bucket.end());
        }

        int index = 0;
        for (NodeId id : ids)
        {
            const LatticeNode &rNode = lattice.node(id);

            os << index << ": " << rNode.begin << " " << rNode.end << " "
               << nodeSurface(rNode, words) << "(" << rNode.wordId << ") "
               << nodePos(rNode, grammar, words) << " "
               << rNode.leftId << " " << rNode.rightId << " " << rNode.cost << ": ";
            ++index;

            for (NodeId lId : lattice.getNodesWithEnd(rNode.begin))
            {
                const LatticeNode &lNode = lattice.node(lId);
                os << grammar.getConnectCost(lNode.rightId, rNode.leftId) << " ";
            }
            os << "\n";
        }
    }

    std::string latticeToJson(const Lattice &lattice, const WordInfoLookup &words)
    {
        namespace karma = boost::spirit::karma;

        typedef std::back_insert_iterator<std::string> iterator_type;

        const Grammar &grammar = lattice.grammar();
        const auto ids = collect_nodes(lattice);

        std::string out;
        iterator_type iter(out);
        json_string_generator<iterator_type> json_string;

        auto put = [&](bool ok)
        {
            if (!ok)
                throw std::runtime_error("failed lattice JSON generation");
        };
        auto put_string = [&](const std::string &s)
        {
            put(karma::generate(iter, json_string, s));
        };
        auto put_key = [&](const std::string &key)
        {
            put_string(key);
            out += ':';
        };
        auto put_int = [&](int v)
        {
            put(karma::generate(iter, karma::int_, v));
        };

        out += '[';
        int nodeId = 0;
        for (NodeId id : ids)
        {
            const LatticeNode &rNode = lattice.node(id);
            const int begin = rNode.begin;
            const int end = rNode.end;

            if (nodeId > 0)
                out += ',';
            out += '{';

            put_key("begin");
            if (begin == end && begin == 0)
                out += "null";
            else
                put_int(begin);

            out += ',';
            put_key("end");
            if (begin == end && begin != 0)
                out += "null";
            else
                put_int(end);

            out += ',';
            put_key("headword");
            put_string(nodeSurface(rNode, words));
            out += ',';
            put_key("wordId");
            put_int(rNode.wordId);
            out += ',';
            put_key("pos");
            put_string(nodePos(rNode, grammar, words));
            out += ',';
            put_key("leftId");
            put_int(rNode.leftId);
            out += ',';
            put_key("rightId");
            put_int(rNode.rightId);
            out += ',';
            put_key("cost");
            put_int(rNode.cost);
            out += ',';
            put_key("nodeId");
            put_int(nodeId++);
            out += ',';

            put_key("connectCosts");
            std::vector<int> connectCosts;
            for (NodeId lId : lattice.getNodesWithEnd(begin))
            {
                const LatticeNode &lNode = lattice.node(lId);
                connectCosts.push_back(grammar.getConnectCost(lNode.rightId, rNode.leftId));
            }
            out += '[';
            if (!connectCosts.empty())
                put(karma::generate(iter, karma::int_ % ',', connectCosts));
            out += ']';

            out += '}';
        }
        out += ']';

        return out;
    }

} // namespace wk
