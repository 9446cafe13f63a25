// src/grammar/connection_matrix.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace wk
{

    // dim x dim connection costs, row-major.
    // row    = rightId of the preceding node
    // column = leftId of the following node
    class ConnectionMatrix
    {
    public:
        ConnectionMatrix() : dim_(0) {}
        explicit ConnectionMatrix(std::vector<int16_t> v);

        // Mozc connection_single_column.txt (dimension line + dim*dim values)
        static ConnectionMatrix loadFromText(const std::filesystem::path &path);
        // big-endian int16 array written by ConnectionReader::writeShortArrayAsBytesBE
        static ConnectionMatrix loadFromBinary(const std::filesystem::path &path);

        int dim() const { return dim_; }
        size_t size() const { return data_.size(); }
        const std::vector<int16_t> &data() const { return data_; }

        int16_t get(int leftId, int rightId) const;
        void set(int leftId, int rightId, int16_t cost);

    private:
        size_t index(int leftId, int rightId) const;

        int dim_;
        std::vector<int16_t> data_;
    };

} // namespace wk
