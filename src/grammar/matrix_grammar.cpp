// src/grammar/matrix_grammar.cpp
#include "grammar/matrix_grammar.hpp"

#include <utility>

namespace wk
{

    MatrixGrammar::MatrixGrammar(ConnectionMatrix conn,
                                 PosTable pos,
                                 NodeParameter bos,
                                 NodeParameter eos)
        : conn_(std::move(conn)),
          pos_(std::move(pos)),
          bos_(bos),
          eos_(eos)
    {
    }

    MatrixGrammar MatrixGrammar::loadMozc(const std::filesystem::path &connPath,
                                          const std::filesystem::path &idDefPath,
                                          bool binary)
    {
        ConnectionMatrix conn = binary ? ConnectionMatrix::loadFromBinary(connPath)
                                       : ConnectionMatrix::loadFromText(connPath);
        PosTable pos = PosTable::loadFromIdDef(idDefPath);

        const NodeParameter sentinel{/*leftId=*/0, /*rightId=*/0, /*cost=*/0};
        return MatrixGrammar(std::move(conn), std::move(pos), sentinel, sentinel);
    }

    int16_t MatrixGrammar::getConnectCost(int16_t leftId, int16_t rightId) const
    {
        return conn_.get(leftId, rightId);
    }

    std::vector<std::string> MatrixGrammar::getPartOfSpeechString(int16_t posId) const
    {
        return pos_.getPartOfSpeechString(posId);
    }

    void MatrixGrammar::setConnectCost(int16_t leftId, int16_t rightId, int16_t cost)
    {
        conn_.set(leftId, rightId, cost);
    }

    void MatrixGrammar::inhibitConnection(int16_t leftId, int16_t rightId)
    {
        conn_.set(leftId, rightId, INHIBITED_CONNECTION);
    }

} // namespace wk
