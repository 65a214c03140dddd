#include <codelang/config.hpp>
#include <codelang/model_loader.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace codelang {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

}  // namespace

Config Config::from_environment() {
    Config config;

    const char* model = std::getenv(MODEL_PATH_ENV);
    if (model && model[0] != '\0') {
        config.model_path = model;
    }

    const char* verbose = std::getenv(VERBOSE_ENV);
    if (verbose) {
        std::string value = to_lower(verbose);
        config.verbose = (value == "1" || value == "true" || value == "yes");
    }

    return config;
}

Result<ModelHandle> load_model(const Config& config, Logger& logger) {
    if (config.model_path.empty()) {
        logger.debug("Using embedded model");
        return Model::embedded(logger);
    }
    return ModelLoader(logger).load_file(config.model_path);
}

}  // namespace codelang
