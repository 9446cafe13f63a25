// src/grammar/pos_table.cpp
#include "grammar/pos_table.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

#include "grammar/connection_reader.hpp"

namespace wk
{

    static std::vector<std::string> split_commas(const std::string &s)
    {
        std::vector<std::string> out;
        size_t start = 0;
        while (true)
        {
            const size_t p = s.find(',', start);
            if (p == std::string::npos)
            {
                out.push_back(s.substr(start));
                break;
            }
            out.push_back(s.substr(start, p - start));
            start = p + 1;
        }
        return out;
    }

    PosTable PosTable::loadFromIdDef(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("PosTable: failed to open: " + path.string());
        return loadFromIdDef(in);
    }

    PosTable PosTable::loadFromIdDef(std::istream &in)
    {
        PosTable t;

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line))
        {
            ++lineNo;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            const size_t sp = line.find(' ');
            if (sp == std::string::npos)
                throw std::runtime_error("PosTable: missing label at line " + std::to_string(lineNo));

            const int16_t id = ConnectionReader::parseInt16(line.substr(0, sp));
            if (id < 0 || static_cast<size_t>(id) != t.labels_.size())
            {
                throw std::runtime_error("PosTable: expected id " + std::to_string(t.labels_.size()) +
                                         " at line " + std::to_string(lineNo));
            }

            t.add(split_commas(line.substr(sp + 1)));
        }

        return t;
    }

    int16_t PosTable::add(std::vector<std::string> labels)
    {
        if (labels_.size() >= static_cast<size_t>(std::numeric_limits<int16_t>::max()))
            throw std::runtime_error("PosTable: too many entries");

        labels_.push_back(std::move(labels));
        return static_cast<int16_t>(labels_.size() - 1);
    }

    const std::vector<std::string> &PosTable::getPartOfSpeechString(int16_t posId) const
    {
        if (posId < 0 || static_cast<size_t>(posId) >= labels_.size())
            throw std::out_of_range("PosTable: posId out of range: " + std::to_string(posId));
        return labels_[static_cast<size_t>(posId)];
    }

} // namespace wk
