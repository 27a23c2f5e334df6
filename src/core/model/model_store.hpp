#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

// Local weight storage in the Hugging Face hub cache layout:
//   <root>/models--<org>--<repo>/refs/<revision>         commit hash
//   <root>/models--<org>--<repo>/snapshots/<commit>/<f>  weight file
//   <root>/models--<org>--<repo>/blobs/<etag>            content
class ModelStore {
public:
    // repo_id is "<org>/<repo>", e.g. "ggerganov/whisper.cpp".
    ModelStore(std::filesystem::path root, const std::string& repo_id);

    const std::filesystem::path& repo_dir() const { return repo_dir_; }

    std::optional<std::filesystem::path> find(const std::string& file_name,
                                              const std::string& revision) const;

    // Where an in-progress download of file_name is written.
    std::filesystem::path incomplete_path(const std::string& file_name) const;

    // Moves a finished download into blobs/ and links it from the snapshot.
    std::expected<std::filesystem::path, std::string>
        commit(const std::string& file_name, const std::string& revision,
               const std::filesystem::path& downloaded, const std::string& etag,
               const std::string& commit_hash);

    std::optional<std::string> read_ref(const std::string& revision) const;

    // "https://huggingface.co/ggerganov/whisper.cpp" -> "ggerganov/whisper.cpp"
    static std::string repo_id_from_url(const std::string& url);

private:
    std::filesystem::path repo_dir_;
};
