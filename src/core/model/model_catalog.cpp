#include "model_catalog.hpp"

#include <array>

namespace catalog {

namespace {

constexpr std::array<ModelInfo, 9> kModels = {{
    {"tiny", "ggml-tiny.bin", "39M", false},
    {"base", "ggml-base.bin", "74M", false},
    {"small", "ggml-small.bin", "244M", false},
    {"medium", "ggml-medium.bin", "769M", false},
    {"large", "ggml-large-v3-turbo.bin", "809M", false},
    {"tiny.en", "ggml-tiny.en.bin", "39M", true},
    {"base.en", "ggml-base.en.bin", "74M", true},
    {"small.en", "ggml-small.en.bin", "244M", true},
    {"medium.en", "ggml-medium.en.bin", "769M", true},
}};

} // namespace

std::span<const ModelInfo> models() {
    return kModels;
}

std::string_view default_model() {
    return "small";
}

std::expected<ModelInfo, std::string> find(std::string_view name) {
    for (const auto& m : kModels) {
        if (m.name == name) return m;
    }
    return std::unexpected("unknown model '" + std::string(name) + "' (choices: " + choices() + ")");
}

std::string choices() {
    std::string out;
    for (const auto& m : kModels) {
        if (!out.empty()) out += ", ";
        out += m.name;
    }
    return out;
}

std::vector<std::string> selectable(std::string_view configured) {
    std::vector<std::string> out;
    for (const auto& m : kModels) out.emplace_back(m.name);
    if (!configured.empty() && !find(configured)) out.emplace_back(configured);
    return out;
}

} // namespace catalog
