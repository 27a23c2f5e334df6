#pragma once

#include "model_fetcher.hpp"
#include "model_store.hpp"

#include <expected>
#include <string>

struct ModelHandle {
    std::string name;
    std::string path;
    bool downloaded = false;
};

class ModelResolver {
public:
    struct Options {
        std::string dir;
        std::string source; // repo URL, files served under /resolve/<revision>/
        std::string revision = "main";
        bool offline = false;
    };

    ModelResolver(Options opts, ModelFetcher& fetcher, bool verbose = false);

    // Accepts a catalog name or a path to an existing weight file.
    std::expected<ModelHandle, std::string> resolve(const std::string& name,
                                                    const FetchProgress& progress = {});

    bool is_available(const std::string& name) const;

    std::string download_url(const std::string& file_name) const;

private:
    void log(const std::string& msg);

    Options opts_;
    ModelFetcher& fetcher_;
    ModelStore store_;
    bool verbose_;
};
