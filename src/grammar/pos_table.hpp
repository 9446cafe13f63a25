// src/grammar/pos_table.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace wk
{

    // Part-of-speech labels indexed by POS id.
    //
    // id.def format (Mozc):
    //   <id> <label>,<label>,...
    // ids are dense and ascending from 0.
    class PosTable
    {
    public:
        static PosTable loadFromIdDef(const std::filesystem::path &path);
        static PosTable loadFromIdDef(std::istream &in);

        int16_t add(std::vector<std::string> labels);
        size_t size() const { return labels_.size(); }

        const std::vector<std::string> &getPartOfSpeechString(int16_t posId) const;

    private:
        std::vector<std::vector<std::string>> labels_;
    };

} // namespace wk
