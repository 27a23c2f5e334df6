#include "audio_loader.hpp"

#include "resample.hpp"
#include "wav_decoder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace audio {

namespace {

constexpr std::array<std::string_view, 6> kExtensions = {"mp3", "wav", "m4a", "ogg", "flac", "webm"};

std::string lower_extension(const std::string& path) {
    auto ext = fs::path(path).extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::expected<std::vector<uint8_t>, std::string> read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path + ": " + std::strerror(errno));
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(f), {});
}

std::string last_line(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    auto nl = s.find_last_of('\n');
    return nl == std::string::npos ? s : s.substr(nl + 1);
}

} // namespace

std::span<const std::string_view> supported_extensions() {
    return kExtensions;
}

std::expected<std::vector<float>, std::string>
decode_with_ffmpeg(const std::string& path, const std::string& ffmpeg, uint32_t sample_rate) {
    int out_pipe[2];
    int err_pipe[2];
    if (::pipe(out_pipe) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe(err_pipe) < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::string rate = std::to_string(sample_rate);

    pid_t pid = ::fork();
    if (pid < 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout carries raw samples, stderr carries diagnostics
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);
        ::execlp(ffmpeg.c_str(), ffmpeg.c_str(), "-nostdin", "-hide_banner",
                 "-loglevel", "error", "-i", path.c_str(), "-vn",
                 "-f", "f32le", "-acodec", "pcm_f32le", "-ac", "1", "-ar", rate.c_str(),
                 "-", nullptr);
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    std::vector<uint8_t> raw;
    std::string errors;
    pollfd fds[2] = {
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    };
    int open_fds = 2;
    char buf[65536];

    while (open_fds > 0) {
        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (auto& p : fds) {
            if (p.fd < 0 || !(p.revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t r = ::read(p.fd, buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            if (r <= 0) {
                ::close(p.fd);
                p.fd = -1;
                --open_fds;
                continue;
            }
            if (p.fd == out_pipe[0]) raw.insert(raw.end(), buf, buf + r);
            else errors.append(buf, static_cast<size_t>(r));
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected("could not run '" + ffmpeg + "'; install ffmpeg to decode ." +
                               lower_extension(path) + " files");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::string detail = last_line(errors);
        return std::unexpected("ffmpeg could not decode " + fs::path(path).filename().string() +
                               (detail.empty() ? std::string() : ": " + detail));
    }

    std::vector<float> samples(raw.size() / sizeof(float));
    std::memcpy(samples.data(), raw.data(), samples.size() * sizeof(float));
    return samples;
}

std::expected<std::vector<float>, std::string>
load_file(const std::string& path, const std::string& ffmpeg, uint32_t sample_rate) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected("file not found: " + path);
    }

    std::vector<float> samples;
    if (lower_extension(path) == "wav") {
        auto bytes = read_all(path);
        if (!bytes) return std::unexpected(bytes.error());

        auto decoded = wav::decode(*bytes);
        if (decoded) {
            samples = resample_linear(decoded->samples, decoded->sample_rate, sample_rate);
        } else {
            auto via_ffmpeg = decode_with_ffmpeg(path, ffmpeg, sample_rate);
            if (!via_ffmpeg) {
                return std::unexpected(decoded.error() + "; " + via_ffmpeg.error());
            }
            samples = std::move(*via_ffmpeg);
        }
    } else {
        auto via_ffmpeg = decode_with_ffmpeg(path, ffmpeg, sample_rate);
        if (!via_ffmpeg) return std::unexpected(via_ffmpeg.error());
        samples = std::move(*via_ffmpeg);
    }

    if (samples.empty()) {
        return std::unexpected("no audio samples in " + fs::path(path).filename().string());
    }
    return samples;
}

} // namespace audio
