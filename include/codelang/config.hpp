#pragma once

#include <codelang/model.hpp>
#include <codelang/result.hpp>
#include <codelang/util/logger.hpp>

#include <filesystem>
#include <string>

namespace codelang {

namespace fs = std::filesystem;

// Environment variables read by Config::from_environment()
constexpr const char* MODEL_PATH_ENV = "CODELANG_MODEL";
constexpr const char* VERBOSE_ENV = "CODELANG_VERBOSE";

/**
 * Settings for loading a model and reporting results.
 */
struct Config {
    fs::path model_path;   // Empty = model embedded in the library
    bool verbose = false;  // Debug logging
    size_t top_n = 5;      // Vote totals shown by explain()

    // Defaults overridden by CODELANG_MODEL / CODELANG_VERBOSE
    static Config from_environment();
};

/**
 * Load the model a config points at: the embedded one when
 * model_path is empty, otherwise the JSON file at model_path.
 */
Result<ModelHandle> load_model(const Config& config, Logger& logger = null_logger());

}  // namespace codelang
