#include "model_resolver.hpp"

#include "model_catalog.hpp"

#include <filesystem>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

ModelResolver::ModelResolver(Options opts, ModelFetcher& fetcher, bool verbose)
    : opts_(std::move(opts)), fetcher_(fetcher),
      store_(opts_.dir, ModelStore::repo_id_from_url(opts_.source)),
      verbose_(verbose) {}

std::string ModelResolver::download_url(const std::string& file_name) const {
    std::string base = opts_.source;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/resolve/" + opts_.revision + "/" + file_name;
}

bool ModelResolver::is_available(const std::string& name) const {
    std::error_code ec;
    if (fs::is_regular_file(name, ec)) return true;
    auto info = catalog::find(name);
    if (!info) return false;
    return store_.find(std::string(info->file_name), opts_.revision).has_value();
}

std::expected<ModelHandle, std::string>
ModelResolver::resolve(const std::string& name, const FetchProgress& progress) {
    std::error_code ec;
    if (name.ends_with(".bin") && fs::is_regular_file(name, ec)) {
        return ModelHandle{.name = fs::path(name).stem().string(), .path = name};
    }

    auto info = catalog::find(name);
    if (!info) return std::unexpected(info.error());

    const std::string file_name(info->file_name);
    if (auto local = store_.find(file_name, opts_.revision)) {
        log("Found " + file_name + " at " + local->string());
        return ModelHandle{.name = name, .path = local->string()};
    }

    if (opts_.offline) {
        return std::unexpected("model '" + name + "' is not in " + opts_.dir +
                               " and offline mode is enabled");
    }

    fs::create_directories(store_.repo_dir() / "blobs", ec);
    if (ec) {
        return std::unexpected("cannot create model directory " +
                               store_.repo_dir().string() + ": " + ec.message());
    }

    auto url = download_url(file_name);
    auto partial = store_.incomplete_path(file_name);
    log("Downloading " + url);

    auto fetched = fetcher_.fetch(url, partial, progress);
    if (!fetched) {
        fs::remove(partial, ec);
        return std::unexpected(fetched.error());
    }
    if (fetched->bytes == 0) {
        fs::remove(partial, ec);
        return std::unexpected("downloaded " + file_name + " is empty");
    }

    auto installed = store_.commit(file_name, opts_.revision, partial,
                                   fetched->etag, fetched->commit);
    if (!installed) {
        fs::remove(partial, ec);
        return std::unexpected(installed.error());
    }

    log("Stored " + file_name + " (" + std::to_string(fetched->bytes) + " bytes)");
    return ModelHandle{.name = name, .path = installed->string(), .downloaded = true};
}

void ModelResolver::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperdesk] {}", msg);
    }
}
