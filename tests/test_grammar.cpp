#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "grammar/connection_matrix.hpp"
#include "grammar/connection_reader.hpp"
#include "grammar/matrix_grammar.hpp"
#include "grammar/pos_table.hpp"

static void assert_true(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "[FAIL] " << msg << "\n";
        std::exit(1);
    }
}

template <typename E, typename F>
static bool throws(F f)
{
    try
    {
        f();
    }
    catch (const E &)
    {
        return true;
    }
    return false;
}

static void write_text(const std::string &path, const std::string &text)
{
    std::ofstream os(path, std::ios::binary);
    os << text;
}

int main()
{
    // =========================================================
    // 1) connection_single_column text
    // =========================================================
    {
        std::istringstream in("2\r\n0\r\n-5\n\n120\n32767\n");
        const auto v = wk::ConnectionReader::readSingleColumnText(in);
        const std::vector<int16_t> expected = {0, -5, 120, 32767};
        assert_true(v == expected, "single column text should skip the header, CR and blank lines");

        std::istringstream bad("1\nabc\n");
        assert_true(throws<std::runtime_error>([&] { wk::ConnectionReader::readSingleColumnText(bad); }),
                    "non-integer line should throw");

        std::istringstream big("1\n40000\n");
        assert_true(throws<std::runtime_error>([&] { wk::ConnectionReader::readSingleColumnText(big); }),
                    "value outside int16 should throw");

        assert_true(wk::ConnectionReader::parseInt16(" -12 ") == -12, "parseInt16 should trim blanks");
        assert_true(throws<std::runtime_error>([] { wk::ConnectionReader::parseInt16(""); }),
                    "empty integer should throw");
    }

    // =========================================================
    // 2) big-endian binary
    // =========================================================
    {
        const std::vector<int16_t> v = {1, -1, 0x1234, wk::Grammar::INHIBITED_CONNECTION};
        std::stringstream ss;
        wk::ConnectionReader::writeShortArrayAsBytesBE(v, ss);

        const std::string bytes = ss.str();
        assert_true(bytes.size() == 8, "4 shorts should be 8 bytes");
        assert_true(static_cast<unsigned char>(bytes[4]) == 0x12 &&
                        static_cast<unsigned char>(bytes[5]) == 0x34,
                    "shorts should be written big-endian");
        assert_true(static_cast<unsigned char>(bytes[2]) == 0xFF &&
                        static_cast<unsigned char>(bytes[3]) == 0xFF,
                    "negative values keep their bit pattern");

        ss.seekg(0);
        assert_true(wk::ConnectionReader::readShortArrayFromBytesBE(ss) == v, "binary should read back");

        std::istringstream odd(std::string("\x00\x01\x02", 3));
        assert_true(throws<std::runtime_error>([&] { wk::ConnectionReader::readShortArrayFromBytesBE(odd); }),
                    "odd byte count should throw");
    }

    // =========================================================
    // 3) ConnectionMatrix
    // =========================================================
    {
        wk::ConnectionMatrix m(std::vector<int16_t>{0, 1, 2, 3, 4, 5, 6, 7, 8});
        assert_true(m.dim() == 3, "9 values should give dim 3");
        assert_true(m.get(1, 2) == 5, "get(1,2) should be row 1 column 2");
        assert_true(m.get(2, 0) == 6, "get(2,0) should be row 2 column 0");

        m.set(0, 1, -7);
        assert_true(m.get(0, 1) == -7, "set should update the cell");

        assert_true(throws<std::out_of_range>([&] { m.get(3, 0); }), "row out of range should throw");
        assert_true(throws<std::out_of_range>([&] { m.get(0, -1); }), "negative column should throw");
        assert_true(throws<std::runtime_error>([] { (void)wk::ConnectionMatrix(std::vector<int16_t>{1, 2, 3}); }),
                    "non-square size should throw");
        assert_true(throws<std::runtime_error>([] { (void)wk::ConnectionMatrix(std::vector<int16_t>{}); }),
                    "empty data should throw");
    }

    // =========================================================
    // 4) ConnectionMatrix files
    // =========================================================
    {
        const std::string text_path = "grammar_test_connection.txt";
        write_text(text_path, "2\n0\n10\n20\n30\n");
        const auto m = wk::ConnectionMatrix::loadFromText(text_path);
        assert_true(m.dim() == 2 && m.get(1, 0) == 20, "text matrix should load");

        const std::string bin_path = "grammar_test_connection.bin";
        wk::ConnectionReader::writeShortArrayAsBytesBE(m.data(), bin_path);
        const auto b = wk::ConnectionMatrix::loadFromBinary(bin_path);
        assert_true(b.data() == m.data(), "binary matrix should match the text one");

        const std::string bad_path = "grammar_test_connection_bad.txt";
        write_text(bad_path, "3\n0\n10\n20\n30\n");
        assert_true(throws<std::runtime_error>([&] { wk::ConnectionMatrix::loadFromText(bad_path); }),
                    "header/value count mismatch should throw");

        assert_true(throws<std::runtime_error>([] { wk::ConnectionMatrix::loadFromText("no_such_file.txt"); }),
                    "missing file should throw");

        std::filesystem::remove(text_path);
        std::filesystem::remove(bin_path);
        std::filesystem::remove(bad_path);
    }

    // =========================================================
    // 5) PosTable (id.def)
    // =========================================================
    {
        std::istringstream in("0 BOS/EOS,*,*,*,*,*,*\r\n1 名詞,一般,*,*,*,*,*\n\n2 助詞,格助詞,一般,*,*,*,の\n");
        const auto t = wk::PosTable::loadFromIdDef(in);
        assert_true(t.size() == 3, "id.def should give 3 entries");

        const auto &noun = t.getPartOfSpeechString(1);
        assert_true(noun.size() == 7 && noun[0] == "名詞" && noun[1] == "一般", "labels should split on commas");
        assert_true(t.getPartOfSpeechString(2)[6] == "の", "last label should be kept");

        assert_true(throws<std::out_of_range>([&] { t.getPartOfSpeechString(3); }), "posId past size should throw");
        assert_true(throws<std::out_of_range>([&] { t.getPartOfSpeechString(-1); }), "negative posId should throw");

        std::istringstream gap("0 BOS/EOS\n2 noun\n");
        assert_true(throws<std::runtime_error>([&] { wk::PosTable::loadFromIdDef(gap); }),
                    "non-dense ids should throw");

        std::istringstream nolabel("0\n");
        assert_true(throws<std::runtime_error>([&] { wk::PosTable::loadFromIdDef(nolabel); }),
                    "line without label should throw");
    }

    // =========================================================
    // 6) MatrixGrammar
    // =========================================================
    {
        wk::PosTable pos;
        pos.add({"BOS/EOS"});
        pos.add({"noun", "common"});

        wk::MatrixGrammar g(wk::ConnectionMatrix(std::vector<int16_t>{0, 1, 2, 3}),
                            std::move(pos), {0, 0, 11}, {1, 1, 22});

        assert_true(g.getConnectCost(0, 1) == 1, "connect cost should read the matrix");
        assert_true(g.getBOSParameter().cost == 11, "BOS parameter");
        assert_true(g.getEOSParameter().leftId == 1 && g.getEOSParameter().cost == 22, "EOS parameter");
        assert_true(g.getPartOfSpeechString(1).size() == 2, "POS labels");

        g.setConnectCost(1, 0, 9);
        assert_true(g.getConnectCost(1, 0) == 9, "setConnectCost");

        g.inhibitConnection(1, 1);
        assert_true(g.getConnectCost(1, 1) == wk::Grammar::INHIBITED_CONNECTION, "inhibitConnection");

        const std::string conn_path = "grammar_test_mozc_conn.txt";
        const std::string id_def_path = "grammar_test_id.def";
        write_text(conn_path, "2\n0\n4\n6\n0\n");
        write_text(id_def_path, "0 BOS/EOS,*\n1 noun,*\n");

        const auto mozc = wk::MatrixGrammar::loadMozc(conn_path, id_def_path, /*binary=*/false);
        assert_true(mozc.getConnectCost(1, 0) == 6, "Mozc grammar matrix");
        assert_true(mozc.getBOSParameter().leftId == 0 && mozc.getBOSParameter().cost == 0,
                    "Mozc BOS uses id 0");
        assert_true(mozc.getPartOfSpeechString(0)[0] == "BOS/EOS", "Mozc POS");

        std::filesystem::remove(conn_path);
        std::filesystem::remove(id_def_path);
    }

    std::cout << "[OK] all grammar tests passed\n";
    return 0;
}
