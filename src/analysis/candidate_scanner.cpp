// src/analysis/candidate_scanner.cpp
#include "analysis/candidate_scanner.hpp"

#include <algorithm>
#include <stdexcept>

#include "common/utf8.hpp"

namespace wk
{

    CandidateScanner::CandidateScanner(const Lexicon &lexicon, UnknownWordParameter unk)
        : lexicon_(lexicon), unk_(unk)
    {
    }

    void CandidateScanner::reset()
    {
        unknown_.clear();
    }

    const WordInfo &CandidateScanner::getWordInfo(int32_t wordId) const
    {
        if (wordId >= 0 && static_cast<size_t>(wordId) >= lexicon_.size())
        {
            const size_t i = static_cast<size_t>(wordId) - lexicon_.size();
            if (i >= unknown_.size())
                throw std::out_of_range("CandidateScanner: wordId out of range: " + std::to_string(wordId));
            return unknown_[i];
        }
        return lexicon_.getWordInfo(wordId);
    }

    void CandidateScanner::build(Lattice &lattice, std::string_view utf8)
    {
        std::u32string text;
        if (!utf8_to_u32(utf8, text))
            throw std::runtime_error("CandidateScanner: invalid UTF-8 input");
        build(lattice, text);
    }

    void CandidateScanner::build(Lattice &lattice, const std::u32string &text)
    {
        if (lattice.eosNode() != NO_NODE)
            throw std::logic_error("CandidateScanner: lattice is in use; clear() it first");

        reset();

        const int n = static_cast<int>(text.size());
        lattice.resize(n);

        for (int i = 0; i < n; ++i)
        {
            if (!lattice.hasPreviousNode(i))
                continue;

            bool found = false;

            const size_t maxLen = std::min(lexicon_.maxReadingLength(), static_cast<size_t>(n - i));
            for (size_t len = 1; len <= maxLen; ++len)
            {
                const auto &wordIds = lexicon_.lookup(text.substr(static_cast<size_t>(i), len));
                if (wordIds.empty())
                    continue;

                found = true;
                const int end = i + static_cast<int>(len);
                for (int32_t wordId : wordIds)
                {
                    const LexiconEntry &e = lexicon_.entry(wordId);
                    insertOrReplace(lattice, i, end, LatticeNode(e.leftId, e.rightId, e.cost, wordId));
                }
            }

            // Unknown fallback: 1-char
            if (!found)
            {
                const int32_t wordId = static_cast<int32_t>(lexicon_.size() + unknown_.size());
                unknown_.push_back(WordInfo{u32_to_utf8(text.substr(static_cast<size_t>(i), 1)), -1});

                lattice.insert(i, i + 1, LatticeNode(unk_.leftId, unk_.rightId, unk_.cost, wordId));
            }
        }

        lattice.connectEosNode();
    }

    void CandidateScanner::insertOrReplace(Lattice &lattice, int begin, int end, const LatticeNode &node)
    {
        const std::string &surface = getWordInfo(node.wordId).surface;

        for (NodeId id : lattice.getNodes(begin, end))
        {
            const LatticeNode &other = lattice.node(id);
            if (other.leftId != node.leftId || other.rightId != node.rightId ||
                getWordInfo(other.wordId).surface != surface)
            {
                continue;
            }

            if (node.cost >= other.cost)
                return;

            // nothing begins at `end` yet, so no node depends on `id`
            lattice.remove(begin, end, id);
            break;
        }

        lattice.insert(begin, end, node);
    }

} // namespace wk
