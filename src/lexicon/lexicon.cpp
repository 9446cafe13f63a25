// src/lexicon/lexicon.cpp
#include "lexicon/lexicon.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "common/utf8.hpp"
#include "grammar/connection_reader.hpp"

namespace wk
{

    static bool split5_tabs(std::string_view line,
                            std::string_view &c0,
                            std::string_view &c1,
                            std::string_view &c2,
                            std::string_view &c3,
                            std::string_view &c4)
    {
        size_t p0 = line.find('\t');
        if (p0 == std::string_view::npos)
            return false;
        size_t p1 = line.find('\t', p0 + 1);
        if (p1 == std::string_view::npos)
            return false;
        size_t p2 = line.find('\t', p1 + 1);
        if (p2 == std::string_view::npos)
            return false;
        size_t p3 = line.find('\t', p2 + 1);
        if (p3 == std::string_view::npos)
            return false;

        c0 = line.substr(0, p0);
        c1 = line.substr(p0 + 1, p1 - (p0 + 1));
        c2 = line.substr(p1 + 1, p2 - (p1 + 1));
        c3 = line.substr(p2 + 1, p3 - (p2 + 1));
        c4 = line.substr(p3 + 1);
        return true;
    }

    Lexicon Lexicon::loadMozcTsv(const std::filesystem::path &path)
    {
        Lexicon lex;
        lex.addMozcTsv(path);
        return lex;
    }

    void Lexicon::addMozcTsv(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("Lexicon: failed to open: " + path.string());
        addMozcTsv(in, path.string());
    }

    void Lexicon::addMozcTsv(std::istream &in, const std::string &name)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line))
        {
            ++lineNo;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty() || line.front() == '#')
                continue;

            const std::string where = name + ":" + std::to_string(lineNo);

            std::string_view c0, c1, c2, c3, c4;
            if (!split5_tabs(line, c0, c1, c2, c3, c4))
                throw std::runtime_error("Lexicon: expected 5 tab-separated columns at " + where);

            LexiconEntry e;
            if (!utf8_to_u32(c0, e.reading) || e.reading.empty())
                throw std::runtime_error("Lexicon: bad reading at " + where);

            try
            {
                e.leftId = ConnectionReader::parseInt16(std::string(c1));
                e.rightId = ConnectionReader::parseInt16(std::string(c2));
                e.cost = ConnectionReader::parseInt16(std::string(c3));
            }
            catch (const std::runtime_error &ex)
            {
                throw std::runtime_error(std::string(ex.what()) + " at " + where);
            }

            e.surface = std::string(c4);
            add(std::move(e));
        }
    }

    int32_t Lexicon::add(LexiconEntry entry)
    {
        if (entries_.size() >= static_cast<size_t>(std::numeric_limits<int32_t>::max()))
            throw std::runtime_error("Lexicon: too many entries");

        const int32_t wordId = static_cast<int32_t>(entries_.size());

        if (entry.reading.size() > maxReadingLength_)
            maxReadingLength_ = entry.reading.size();

        index_[entry.reading].push_back(wordId);
        infos_.push_back(WordInfo{entry.surface, entry.leftId});
        entries_.push_back(std::move(entry));
        return wordId;
    }

    const LexiconEntry &Lexicon::entry(int32_t wordId) const
    {
        if (wordId < 0 || static_cast<size_t>(wordId) >= entries_.size())
            throw std::out_of_range("Lexicon: wordId out of range: " + std::to_string(wordId));
        return entries_[static_cast<size_t>(wordId)];
    }

    void Lexicon::checkConnectionIds(int dim) const
    {
        for (size_t i = 0; i < entries_.size(); ++i)
        {
            const LexiconEntry &e = entries_[i];
            if (e.leftId < 0 || e.leftId >= dim || e.rightId < 0 || e.rightId >= dim)
            {
                throw std::runtime_error("Lexicon: entry " + std::to_string(i) + " (" + e.surface +
                                         ") has ids " + std::to_string(e.leftId) + "/" +
                                         std::to_string(e.rightId) + " outside the connection matrix (dim=" +
                                         std::to_string(dim) + ")");
            }
        }
    }

    const std::vector<int32_t> &Lexicon::lookup(const std::u32string &reading) const
    {
        static const std::vector<int32_t> empty;
        const auto it = index_.find(reading);
        return (it == index_.end()) ? empty : it->second;
    }

    const WordInfo &Lexicon::getWordInfo(int32_t wordId) const
    {
        if (wordId < 0 || static_cast<size_t>(wordId) >= infos_.size())
            throw std::out_of_range("Lexicon: wordId out of range: " + std::to_string(wordId));
        return infos_[static_cast<size_t>(wordId)];
    }

} // namespace wk
