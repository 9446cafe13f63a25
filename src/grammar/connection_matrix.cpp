// src/grammar/connection_matrix.cpp
#include "grammar/connection_matrix.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "grammar/connection_reader.hpp"

namespace wk
{

    ConnectionMatrix::ConnectionMatrix(std::vector<int16_t> v)
        : dim_(0), data_(std::move(v))
    {
        if (data_.empty())
            throw std::runtime_error("ConnectionMatrix: empty data");

        const double root = std::sqrt(static_cast<double>(data_.size()));
        const int n = static_cast<int>(root + 0.5);
        if (n <= 0 || static_cast<size_t>(n) * static_cast<size_t>(n) != data_.size())
            throw std::runtime_error("ConnectionMatrix: size is not a perfect square: " + std::to_string(data_.size()));

        dim_ = n;
    }

    ConnectionMatrix ConnectionMatrix::loadFromText(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("ConnectionMatrix: failed to open: " + path.string());

        std::string header;
        if (!std::getline(in, header))
            throw std::runtime_error("ConnectionMatrix: missing dimension line: " + path.string());

        const int dim = static_cast<int>(ConnectionReader::parseInt16(header));
        auto values = ConnectionReader::readSingleColumnText(in, /*skip_first_line=*/false);

        if (dim <= 0 || values.size() != static_cast<size_t>(dim) * static_cast<size_t>(dim))
        {
            throw std::runtime_error("ConnectionMatrix: dimension " + std::to_string(dim) +
                                     " does not match " + std::to_string(values.size()) +
                                     " values: " + path.string());
        }

        return ConnectionMatrix(std::move(values));
    }

    ConnectionMatrix ConnectionMatrix::loadFromBinary(const std::filesystem::path &path)
    {
        return ConnectionMatrix(ConnectionReader::readShortArrayFromBytesBE(path));
    }

    size_t ConnectionMatrix::index(int leftId, int rightId) const
    {
        if (leftId < 0 || rightId < 0 || leftId >= dim_ || rightId >= dim_)
        {
            throw std::out_of_range("ConnectionMatrix: id out of range: (" +
                                    std::to_string(leftId) + ", " + std::to_string(rightId) +
                                    ") dim=" + std::to_string(dim_));
        }
        return static_cast<size_t>(leftId) * static_cast<size_t>(dim_) + static_cast<size_t>(rightId);
    }

    int16_t ConnectionMatrix::get(int leftId, int rightId) const
    {
        return data_[index(leftId, rightId)];
    }

    void ConnectionMatrix::set(int leftId, int rightId, int16_t cost)
    {
        data_[index(leftId, rightId)] = cost;
    }

} // namespace wk
