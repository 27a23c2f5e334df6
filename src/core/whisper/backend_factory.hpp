#pragma once

#include "../config.hpp"
#include "backend.hpp"

#include <expected>
#include <memory>
#include <string>

std::expected<std::unique_ptr<InferenceBackend>, std::string>
    make_backend(const Config& config, bool verbose = false);
