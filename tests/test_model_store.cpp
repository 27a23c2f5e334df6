#include <catch2/catch_test_macros.hpp>

#include "model/model_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// RAII temp directory that auto-deletes.
struct TmpDir {
    fs::path path;

    TmpDir() {
        std::string tmpl = (fs::temp_directory_path() / "wd_test_store_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << content;
}

std::string read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(f), {}};
}

} // namespace

TEST_CASE("ModelStore", "[model]") {
    TmpDir tmp;
    ModelStore store(tmp.path, "ggerganov/whisper.cpp");

    SECTION("RepoDirLayout") {
        REQUIRE(store.repo_dir() == tmp.path / "models--ggerganov--whisper.cpp");
    }

    SECTION("RepoIdFromUrl") {
        REQUIRE(ModelStore::repo_id_from_url("https://huggingface.co/ggerganov/whisper.cpp") ==
                "ggerganov/whisper.cpp");
        REQUIRE(ModelStore::repo_id_from_url("https://huggingface.co/ggerganov/whisper.cpp/") ==
                "ggerganov/whisper.cpp");
        REQUIRE(ModelStore::repo_id_from_url("http://mirror.local:8000/org/repo") == "org/repo");
    }

    SECTION("EmptyStoreFindsNothing") {
        REQUIRE_FALSE(store.find("ggml-tiny.bin", "main").has_value());
        REQUIRE_FALSE(store.read_ref("main").has_value());
    }

    SECTION("CommitLinksBlobIntoSnapshot") {
        auto partial = store.incomplete_path("ggml-tiny.bin");
        REQUIRE(partial == store.repo_dir() / "blobs" / "ggml-tiny.bin.incomplete");
        write_file(partial, "weights");

        auto installed = store.commit("ggml-tiny.bin", "main", partial, "e7a1", "c0ffee");
        REQUIRE(installed.has_value());
        REQUIRE(*installed == store.repo_dir() / "snapshots" / "c0ffee" / "ggml-tiny.bin");
        REQUIRE(fs::is_symlink(*installed));
        REQUIRE(fs::read_symlink(*installed) == fs::path("../../blobs/e7a1"));
        REQUIRE(read_file(*installed) == "weights");
        REQUIRE_FALSE(fs::exists(partial));

        REQUIRE(store.read_ref("main") == "c0ffee");
        REQUIRE(store.find("ggml-tiny.bin", "main") == *installed);
    }

    SECTION("CommitWithoutHubHeaders") {
        auto partial = store.incomplete_path("ggml-base.bin");
        write_file(partial, "weights");

        auto installed = store.commit("ggml-base.bin", "main", partial, "", "");
        REQUIRE(installed.has_value());
        REQUIRE(*installed == store.repo_dir() / "snapshots" / "main" / "ggml-base.bin");
        REQUIRE(fs::exists(store.repo_dir() / "blobs" / "ggml-base.bin"));
        REQUIRE(store.read_ref("main") == "main");
    }

    SECTION("FindScansSnapshotsWithoutRef") {
        // Copied in by hand, no refs/ entry
        auto p = store.repo_dir() / "snapshots" / "abc" / "ggml-small.bin";
        write_file(p, "weights");

        REQUIRE(store.find("ggml-small.bin", "main") == p);
    }

    SECTION("FindAcceptsCommitAsRevision") {
        auto p = store.repo_dir() / "snapshots" / "deadbeef" / "ggml-small.bin";
        write_file(p, "weights");
        REQUIRE(store.find("ggml-small.bin", "deadbeef") == p);
    }

    SECTION("EmptyFileIgnored") {
        write_file(store.repo_dir() / "snapshots" / "abc" / "ggml-small.bin", "");
        REQUIRE_FALSE(store.find("ggml-small.bin", "main").has_value());
    }

    SECTION("DanglingSymlinkIgnored") {
        auto snap = store.repo_dir() / "snapshots" / "abc";
        fs::create_directories(snap);
        fs::create_symlink("../../blobs/missing", snap / "ggml-small.bin");
        REQUIRE_FALSE(store.find("ggml-small.bin", "main").has_value());
    }
}
