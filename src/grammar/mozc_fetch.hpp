// src/grammar/mozc_fetch.hpp
#pragma once

#include <filesystem>
#include <string>

namespace wk
{

    struct MozcGrammarFiles
    {
        std::filesystem::path connection; // connection_single_column.txt
        std::filesystem::path idDef;      // id.def
    };

    class MozcFetch
    {
    public:
        static constexpr const char *DEFAULT_BASE_URL =
            "https://raw.githubusercontent.com/google/mozc/master/src/data/dictionary_oss/";

        // curl_global_init / curl_global_cleanup for the lifetime of this object
        MozcFetch();
        ~MozcFetch();

        MozcFetch(const MozcFetch &) = delete;
        MozcFetch &operator=(const MozcFetch &) = delete;

        void downloadFile(const std::string &url, const std::filesystem::path &out_path) const;

        // Skips files that already exist and are non-empty.
        MozcGrammarFiles fetchGrammar(const std::filesystem::path &out_dir,
                                      const std::string &base_url = DEFAULT_BASE_URL) const;

        static bool fileExistsNonEmpty(const std::filesystem::path &p);
    };

} // namespace wk
