#pragma once

#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct ModelInfo {
    std::string_view name;      // user-facing size, e.g. "small"
    std::string_view file_name; // ggml weight file in the model repo
    std::string_view params;    // parameter count, for display
    bool english_only = false;
};

namespace catalog {

std::span<const ModelInfo> models();

std::string_view default_model();

std::expected<ModelInfo, std::string> find(std::string_view name);

// "tiny, base, small, ..." for usage and error messages.
std::string choices();

// Catalog names for a model picker, followed by the configured model when
// it is not one of them (a weight file path, or a name that will fail).
std::vector<std::string> selectable(std::string_view configured);

} // namespace catalog
