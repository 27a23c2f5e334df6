#include "backend_factory.hpp"

#include "lan_backend.hpp"
#include "whisper_cpp_backend.hpp"

std::expected<std::unique_ptr<InferenceBackend>, std::string>
make_backend(const Config& config, bool verbose) {
    const auto& b = config.backend;
    if (b.type == "local") {
        return std::make_unique<WhisperCppBackend>(b.use_gpu, verbose);
    }
    if (b.type == "lan") {
        if (b.api_format != "whisper.cpp" && b.api_format != "openai") {
            return std::unexpected("unknown api_format '" + b.api_format + "' (expected whisper.cpp or openai)");
        }
        return std::make_unique<LanBackend>(b.url, b.api_format, b.remote_model, verbose);
    }
    return std::unexpected("unknown backend type '" + b.type + "' (expected local or lan)");
}
