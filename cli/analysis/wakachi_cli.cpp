// cli/analysis/wakachi_cli.cpp
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/candidate_scanner.hpp"
#include "grammar/matrix_grammar.hpp"
#include "lattice/lattice.hpp"
#include "lattice/lattice_dump.hpp"
#include "lexicon/lexicon.hpp"

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0
        << " --conn <connection_single_column.txt> --id_def <id.def> --dict <dictionary.tsv> [--dict ...]\n"
        << "      --q <utf8> [--dump] [--json] [--unk_cost N] [--unk_id ID]\n"
        << "  " << argv0
        << " --conn <connection_single_column.bin> --conn_bin --id_def <id.def> --dict <dictionary.tsv>\n"
        << "      --stdin [--dump] [--json] [--unk_cost N] [--unk_id ID]\n";
}

static int16_t parse_i16_arg(const std::string &name, const std::string &value)
{
    const int v = std::stoi(value);
    if (v < INT16_MIN || v > INT16_MAX)
        throw std::runtime_error("Out of int16 range: " + name + " " + value);
    return static_cast<int16_t>(v);
}

static void run_one(wk::Lattice &lattice,
                    wk::CandidateScanner &scanner,
                    const wk::Grammar &grammar,
                    const std::string &q_utf8,
                    bool dump,
                    bool json)
{
    try
    {
        // 1) build lattice
        scanner.build(lattice, q_utf8);

        std::cout << "query=" << q_utf8 << " len=" << lattice.size() << "\n";

        if (dump)
            wk::dumpLattice(lattice, scanner, std::cout);
        if (json)
            std::cout << wk::latticeToJson(lattice, scanner) << "\n";

        // 2) best path
        const auto path = lattice.getBestPath();
        for (wk::NodeId id : path)
        {
            const wk::LatticeNode &n = lattice.node(id);
            std::cout << wk::nodeSurface(n, scanner)
                      << "\t" << wk::nodePos(n, grammar, scanner)
                      << "\t" << n.begin
                      << "\t" << n.end
                      << "\t" << n.cost << "\n";
        }
        std::cout << "total=" << lattice.node(lattice.eosNode()).totalCost << "\n";
    }
    catch (const wk::EosNotConnectedError &e)
    {
        std::cout << "[NO_PATH] " << q_utf8 << ": " << e.what() << "\n";
    }
    catch (const std::runtime_error &e)
    {
        std::cout << "[BAD_INPUT] " << q_utf8 << ": " << e.what() << "\n";
    }

    lattice.clear();
}

int main(int argc, char **argv)
{
    try
    {
        std::string conn_path;
        std::string id_def_path;
        std::vector<std::string> dict_paths;
        bool conn_bin = false;

        std::string q;
        bool stdin_mode = false;
        bool dump = false;
        bool json = false;

        wk::UnknownWordParameter unk;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--conn" && i + 1 < argc)
            {
                conn_path = argv[++i];
                continue;
            }
            if (a == "--conn_bin")
            {
                conn_bin = true;
                continue;
            }
            if (a == "--id_def" && i + 1 < argc)
            {
                id_def_path = argv[++i];
                continue;
            }
            if (a == "--dict" && i + 1 < argc)
            {
                dict_paths.push_back(argv[++i]);
                continue;
            }
            if (a == "--q" && i + 1 < argc)
            {
                q = argv[++i];
                continue;
            }
            if (a == "--stdin")
            {
                stdin_mode = true;
                continue;
            }
            if (a == "--dump")
            {
                dump = true;
                continue;
            }
            if (a == "--json")
            {
                json = true;
                continue;
            }
            if (a == "--unk_cost" && i + 1 < argc)
            {
                unk.cost = parse_i16_arg(a, argv[++i]);
                continue;
            }
            if (a == "--unk_id" && i + 1 < argc)
            {
                unk.leftId = unk.rightId = parse_i16_arg(a, argv[++i]);
                continue;
            }

            throw std::runtime_error("Unknown/incomplete arg: " + a);
        }

        if (conn_path.empty() || id_def_path.empty() || dict_paths.empty() ||
            (!stdin_mode && q.empty()))
        {
            usage(argv[0]);
            return 2;
        }

        const auto grammar = wk::MatrixGrammar::loadMozc(conn_path, id_def_path, conn_bin);

        wk::Lexicon lexicon;
        for (const auto &p : dict_paths)
        {
            lexicon.addMozcTsv(p);
            std::cerr << "Loaded " << p << " (entries=" << lexicon.size() << ")\n";
        }

        const int dim = grammar.connection().dim();
        lexicon.checkConnectionIds(dim);
        if (unk.leftId < 0 || unk.leftId >= dim)
            throw std::runtime_error("--unk_id outside the connection matrix (dim=" + std::to_string(dim) + ")");

        wk::CandidateScanner scanner(lexicon, unk);
        wk::Lattice lattice(grammar);

        if (!stdin_mode)
        {
            run_one(lattice, scanner, grammar, q, dump, json);
            return 0;
        }

        std::string line;
        while (std::getline(std::cin, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            run_one(lattice, scanner, grammar, line, dump, json);
        }

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
