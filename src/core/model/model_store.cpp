#include "model_store.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool usable_file(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false; // follows snapshot symlinks
    auto size = fs::file_size(p, ec);
    return !ec && size > 0;
}

} // namespace

ModelStore::ModelStore(fs::path root, const std::string& repo_id) {
    std::string folder = "models--";
    for (char c : repo_id) {
        if (c == '/') folder += "--";
        else folder += c;
    }
    repo_dir_ = std::move(root) / folder;
}

std::string ModelStore::repo_id_from_url(const std::string& url) {
    std::string rest = url;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
        auto slash = rest.find('/');
        rest = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
    }
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    return rest;
}

std::optional<std::string> ModelStore::read_ref(const std::string& revision) const {
    std::ifstream f(repo_dir_ / "refs" / revision);
    if (!f.is_open()) return std::nullopt;
    std::string hash;
    std::getline(f, hash);
    while (!hash.empty() && (hash.back() == '\r' || hash.back() == ' ')) hash.pop_back();
    if (hash.empty()) return std::nullopt;
    return hash;
}

std::optional<fs::path> ModelStore::find(const std::string& file_name,
                                         const std::string& revision) const {
    auto snapshots = repo_dir_ / "snapshots";

    if (auto ref = read_ref(revision)) {
        auto p = snapshots / *ref / file_name;
        if (usable_file(p)) return p;
    }

    // A commit hash passed directly as the revision.
    auto direct = snapshots / revision / file_name;
    if (usable_file(direct)) return direct;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(snapshots, ec)) {
        auto p = entry.path() / file_name;
        if (usable_file(p)) return p;
    }
    return std::nullopt;
}

fs::path ModelStore::incomplete_path(const std::string& file_name) const {
    return repo_dir_ / "blobs" / (file_name + ".incomplete");
}

std::expected<fs::path, std::string>
ModelStore::commit(const std::string& file_name, const std::string& revision,
                   const fs::path& downloaded, const std::string& etag,
                   const std::string& commit_hash) {
    const std::string snapshot = commit_hash.empty() ? revision : commit_hash;
    const std::string blob_name = etag.empty() ? file_name : etag;

    auto blobs_dir = repo_dir_ / "blobs";
    auto snapshot_dir = repo_dir_ / "snapshots" / snapshot;
    auto refs_dir = repo_dir_ / "refs";

    std::error_code ec;
    for (const auto& dir : {blobs_dir, snapshot_dir, refs_dir}) {
        fs::create_directories(dir, ec);
        if (ec) return std::unexpected("cannot create " + dir.string() + ": " + ec.message());
    }

    auto blob = blobs_dir / blob_name;
    fs::rename(downloaded, blob, ec);
    if (ec) return std::unexpected("cannot move download into " + blob.string() + ": " + ec.message());

    auto target = snapshot_dir / file_name;
    fs::remove(target, ec);
    fs::create_symlink(fs::path("..") / ".." / "blobs" / blob_name, target, ec);
    if (ec) {
        // Filesystems without symlinks keep the content in the snapshot.
        fs::rename(blob, target, ec);
        if (ec) return std::unexpected("cannot install " + target.string() + ": " + ec.message());
    }

    std::ofstream ref(refs_dir / revision, std::ios::trunc);
    if (!ref.is_open()) {
        return std::unexpected("cannot write ref " + (refs_dir / revision).string());
    }
    ref << snapshot;

    return target;
}
