#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "grammar/matrix_grammar.hpp"
#include "lattice/lattice.hpp"

static void assert_true(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "[FAIL] " << msg << "\n";
        std::exit(1);
    }
}

static wk::MatrixGrammar make_grammar()
{
    // 0: BOS/EOS, 1: noun, 2: particle
    std::vector<int16_t> m = {
        0, 10, 40,
        5, 30, 0,
        0, 0, 60};
    wk::PosTable pos;
    pos.add({"BOS/EOS"});
    pos.add({"noun"});
    pos.add({"particle"});
    return wk::MatrixGrammar(wk::ConnectionMatrix(std::move(m)), std::move(pos), {0, 0, 0}, {0, 0, 0});
}

struct PathItem
{
    int begin;
    int end;
    int32_t wordId;
    int64_t totalCost;
};

static std::vector<PathItem> summarize(const wk::Lattice &lattice)
{
    std::vector<PathItem> out;
    for (wk::NodeId id : lattice.getBestPath())
    {
        const auto &n = lattice.node(id);
        out.push_back({n.begin, n.end, n.wordId, n.totalCost});
    }
    out.push_back({-1, -1, -1, lattice.node(lattice.eosNode()).totalCost});
    return out;
}

static bool same(const std::vector<PathItem> &a, const std::vector<PathItem> &b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (a[i].begin != b[i].begin || a[i].end != b[i].end ||
            a[i].wordId != b[i].wordId || a[i].totalCost != b[i].totalCost)
            return false;
    }
    return true;
}

// analysis with 6 positions
static void populate_long(wk::Lattice &lattice)
{
    lattice.resize(6);
    lattice.insert(0, 2, wk::LatticeNode(1, 1, 100, 0));
    lattice.insert(0, 3, wk::LatticeNode(1, 1, 250, 1));
    lattice.insert(2, 3, wk::LatticeNode(2, 2, 20, 2));
    lattice.insert(3, 6, wk::LatticeNode(1, 1, 300, 3));
    lattice.insert(3, 5, wk::LatticeNode(1, 1, 120, 4));
    lattice.insert(5, 6, wk::LatticeNode(2, 2, 10, 5));
    lattice.connectEosNode();
}

// analysis with 3 positions
static void populate_short(wk::Lattice &lattice)
{
    lattice.resize(3);
    lattice.insert(0, 1, wk::LatticeNode(1, 1, 50, 10));
    lattice.insert(0, 2, wk::LatticeNode(1, 1, 90, 11));
    lattice.insert(1, 3, wk::LatticeNode(2, 2, 15, 12));
    lattice.insert(2, 3, wk::LatticeNode(2, 2, 15, 13));
    lattice.connectEosNode();
}

int main()
{
    const auto g = make_grammar();

    // =========================================================
    // 1) reuse behaves like a fresh lattice
    // =========================================================
    {
        wk::Lattice reused(g);
        populate_long(reused);
        const auto first = summarize(reused);
        assert_true(first.size() == 5, "long analysis path should hold 4 nodes + EOS");
        reused.clear();

        populate_short(reused);
        const auto second = summarize(reused);

        wk::Lattice fresh(g);
        populate_short(fresh);
        const auto expected = summarize(fresh);

        assert_true(same(second, expected), "reused lattice should match a fresh one");
        for (int e = 0; e <= 3; ++e)
        {
            assert_true(reused.getNodesWithEnd(e).size() == fresh.getNodesWithEnd(e).size(),
                        "bucket sizes should match a fresh lattice");
        }
        assert_true(reused.eosNode() == fresh.eosNode(), "EOS handle should be reproduced");

        reused.clear();
        populate_long(reused);
        assert_true(same(summarize(reused), first), "third analysis should reproduce the first");
    }

    // =========================================================
    // 2) capacity watermark
    // =========================================================
    {
        wk::Lattice lattice(g);
        assert_true(lattice.size() == 0 && lattice.capacity() == 0, "fresh lattice is empty");

        populate_long(lattice);
        assert_true(lattice.size() == 6 && lattice.capacity() == 6, "resize(6) grows capacity");

        lattice.clear();
        assert_true(lattice.size() == 0, "clear resets size");
        assert_true(lattice.capacity() == 6, "clear keeps capacity");
        assert_true(lattice.eosNode() == wk::NO_NODE, "clear drops EOS");
        assert_true(lattice.getNodesWithEnd(0).size() == 1 &&
                        lattice.getNodesWithEnd(0)[0] == lattice.bosNode(),
                    "clear keeps BOS");
        for (int e = 1; e <= 6; ++e)
            assert_true(lattice.getNodesWithEnd(e).empty(), "clear empties buckets");

        bool threw = false;
        try
        {
            lattice.getBestPath();
        }
        catch (const wk::EosNotConnectedError &)
        {
            threw = true;
        }
        assert_true(threw, "getBestPath after clear should fail");

        populate_short(lattice);
        assert_true(lattice.size() == 3 && lattice.capacity() == 6, "smaller resize keeps capacity");
        assert_true(lattice.getNodesWithEnd(6).empty(), "buckets past size stay empty");

        const auto &bos = lattice.node(lattice.bosNode());
        assert_true(bos.isConnectedToBOS && bos.totalCost == 0, "BOS survives reuse unchanged");
    }

    // =========================================================
    // 3) shrinking resize inside an analysis
    // =========================================================
    {
        wk::Lattice lattice(g);
        lattice.resize(5);
        lattice.insert(0, 5, wk::LatticeNode(1, 1, 10, 0));
        lattice.insert(0, 2, wk::LatticeNode(1, 1, 10, 1));

        lattice.resize(2);
        assert_true(lattice.getNodesWithEnd(5).empty(), "buckets past the new size are dropped");
        assert_true(lattice.getNodesWithEnd(2).size() == 1, "buckets within the new size are kept");
        assert_true(lattice.node(lattice.eosNode()).begin == 2, "EOS is recreated at the new size");

        lattice.connectEosNode();
        assert_true(lattice.getBestPath().size() == 1, "path through the kept node");
        lattice.clear();
    }

    std::cout << "[OK] all lattice reuse tests passed\n";
    return 0;
}
