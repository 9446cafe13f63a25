// cli/grammar/fetch_grammar_cli.cpp
//
// Downloads Mozc connection_single_column.txt and id.def, checks that they
// load as a grammar, and optionally writes connection_single_column.bin
// (big-endian int16) next to them.
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "grammar/connection_reader.hpp"
#include "grammar/matrix_grammar.hpp"
#include "grammar/mozc_fetch.hpp"

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [--out <dir>] [--base_url <url>] [--to_bin]\n";
}

int main(int argc, char **argv)
{
    try
    {
        std::filesystem::path out_dir = "grammar";
        std::string base_url = wk::MozcFetch::DEFAULT_BASE_URL;
        bool to_bin = false;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--out" && i + 1 < argc)
            {
                out_dir = argv[++i];
                continue;
            }
            if (a == "--base_url" && i + 1 < argc)
            {
                base_url = argv[++i];
                if (!base_url.empty() && base_url.back() != '/')
                    base_url.push_back('/');
                continue;
            }
            if (a == "--to_bin")
            {
                to_bin = true;
                continue;
            }

            throw std::runtime_error("Unknown/incomplete arg: " + a);
        }

        wk::MozcGrammarFiles files;
        {
            const wk::MozcFetch fetch;
            files = fetch.fetchGrammar(out_dir, base_url);
        }

        const auto grammar = wk::MatrixGrammar::loadMozc(files.connection, files.idDef, /*binary=*/false);
        std::cout << "connection dim=" << grammar.connection().dim()
                  << " pos=" << grammar.posTable().size() << "\n";

        if (to_bin)
        {
            const auto bin_path = out_dir / "connection_single_column.bin";
            wk::ConnectionReader::writeShortArrayAsBytesBE(grammar.connection().data(), bin_path);
            std::cout << "Wrote " << bin_path.string()
                      << " (" << std::filesystem::file_size(bin_path) << " bytes)\n";
        }

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
