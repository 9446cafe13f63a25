// src/grammar/mozc_fetch.cpp
#include "grammar/mozc_fetch.hpp"

#include <curl/curl.h>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace wk
{

    // --------------------
    // libcurl: write callback
    // --------------------
    static size_t write_to_file(void *ptr, size_t size, size_t nmemb, void *stream)
    {
        std::ofstream *out = static_cast<std::ofstream *>(stream);
        const size_t bytes = size * nmemb;
        out->write(static_cast<const char *>(ptr), static_cast<std::streamsize>(bytes));
        return *out ? bytes : 0;
    }

    MozcFetch::MozcFetch()
    {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK)
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
    }

    MozcFetch::~MozcFetch()
    {
        curl_global_cleanup();
    }

    void MozcFetch::downloadFile(const std::string &url, const std::filesystem::path &out_path) const
    {
        CURL *curl = curl_easy_init();
        if (!curl)
            throw std::runtime_error("curl_easy_init failed");

        if (out_path.has_parent_path())
            std::filesystem::create_directories(out_path.parent_path());

        std::ofstream out(out_path, std::ios::binary);
        if (!out)
        {
            curl_easy_cleanup(curl);
            throw std::runtime_error("Failed to open output file: " + out_path.string());
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);

        const CURLcode res = curl_easy_perform(curl);

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        curl_easy_cleanup(curl);
        out.close();

        if (res != CURLE_OK)
        {
            std::filesystem::remove(out_path);
            throw std::runtime_error(std::string("Download failed: ") + curl_easy_strerror(res) + ": " + url);
        }
        if (http_code < 200 || http_code >= 300)
        {
            std::filesystem::remove(out_path);
            throw std::runtime_error("HTTP error: " + std::to_string(http_code) + ": " + url);
        }
    }

    bool MozcFetch::fileExistsNonEmpty(const std::filesystem::path &p)
    {
        std::error_code ec;
        if (!std::filesystem::exists(p, ec))
            return false;
        const auto sz = std::filesystem::file_size(p, ec);
        return (!ec && sz > 0);
    }

    MozcGrammarFiles MozcFetch::fetchGrammar(const std::filesystem::path &out_dir,
                                             const std::string &base_url) const
    {
        MozcGrammarFiles files;
        files.connection = out_dir / "connection_single_column.txt";
        files.idDef = out_dir / "id.def";

        for (const auto &path : {files.connection, files.idDef})
        {
            const std::string fname = path.filename().string();
            if (!fileExistsNonEmpty(path))
            {
                std::cout << "Downloading " << fname << "...\n";
                downloadFile(base_url + fname, path);
            }
            else
            {
                std::cout << "Skip download (exists): " << fname << "\n";
            }
        }

        return files;
    }

} // namespace wk
