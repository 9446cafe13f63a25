// src/grammar/connection_reader.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace wk
{

    class ConnectionReader
    {
    public:
        // connection_single_column.txt (Mozc): one integer per line.
        // The first line holds the matrix dimension, so it is skipped by default.
        static std::vector<std::int16_t> readSingleColumnText(
            const std::filesystem::path &path,
            bool skip_first_line = true);

        static std::vector<std::int16_t> readSingleColumnText(
            std::istream &in,
            bool skip_first_line = true);

        // 2byte*N big-endian binary
        static void writeShortArrayAsBytesBE(
            const std::vector<std::int16_t> &v,
            const std::filesystem::path &out_path);

        static void writeShortArrayAsBytesBE(
            const std::vector<std::int16_t> &v,
            std::ostream &os);

        static std::vector<std::int16_t> readShortArrayFromBytesBE(
            const std::filesystem::path &path);

        static std::vector<std::int16_t> readShortArrayFromBytesBE(std::istream &is);

        static std::int16_t parseInt16(const std::string &s);

    private:
        static void write_u16_be(std::ostream &os, std::uint16_t v);
        static bool read_u16_be(std::istream &is, std::uint16_t &v);
    };

} // namespace wk
