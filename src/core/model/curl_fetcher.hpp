#pragma once

#include "model_fetcher.hpp"

#include <string_view>

class CurlFetcher : public ModelFetcher {
public:
    CurlFetcher();
    ~CurlFetcher() override;

    CurlFetcher(const CurlFetcher&) = delete;
    CurlFetcher& operator=(const CurlFetcher&) = delete;

    std::expected<FetchInfo, std::string>
        fetch(const std::string& url, const std::filesystem::path& dest,
              const FetchProgress& progress) override;

    // Parses one raw header line into info. Exposed for tests.
    static void parse_header_line(std::string_view line, FetchInfo& info);
};
