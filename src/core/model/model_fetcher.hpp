#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

struct FetchInfo {
    std::string etag;   // content hash reported by the hub, unquoted
    std::string commit; // repository revision the file was served from
    uint64_t bytes = 0;
};

// (downloaded, total) in bytes; total is 0 while unknown.
// Returning false cancels the transfer.
using FetchProgress = std::function<bool(uint64_t downloaded, uint64_t total)>;

class ModelFetcher {
public:
    virtual ~ModelFetcher() = default;
    virtual std::expected<FetchInfo, std::string>
        fetch(const std::string& url, const std::filesystem::path& dest,
              const FetchProgress& progress) = 0;
};
