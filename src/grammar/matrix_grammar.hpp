// src/grammar/matrix_grammar.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "grammar/connection_matrix.hpp"
#include "grammar/grammar.hpp"
#include "grammar/pos_table.hpp"

namespace wk
{

    class MatrixGrammar : public Grammar
    {
    public:
        MatrixGrammar(ConnectionMatrix conn,
                      PosTable pos,
                      NodeParameter bos,
                      NodeParameter eos);

        // Mozc convention: id 0 is BOS/EOS, with cost 0 on both sides.
        static MatrixGrammar loadMozc(const std::filesystem::path &connPath,
                                      const std::filesystem::path &idDefPath,
                                      bool binary);

        int16_t getConnectCost(int16_t leftId, int16_t rightId) const override;
        NodeParameter getBOSParameter() const override { return bos_; }
        NodeParameter getEOSParameter() const override { return eos_; }
        std::vector<std::string> getPartOfSpeechString(int16_t posId) const override;

        // Setup-time edits. Not to be called while a lattice is analysing.
        void setConnectCost(int16_t leftId, int16_t rightId, int16_t cost);
        void inhibitConnection(int16_t leftId, int16_t rightId);

        const ConnectionMatrix &connection() const { return conn_; }
        const PosTable &posTable() const { return pos_; }

    private:
        ConnectionMatrix conn_;
        PosTable pos_;
        NodeParameter bos_;
        NodeParameter eos_;
    };

} // namespace wk
