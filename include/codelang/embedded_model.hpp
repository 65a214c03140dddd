#pragma once

#include <string>

namespace codelang {

// JSON text of the trained model, generated from data/model.json at build time
const std::string& embedded_model_json();

}  // namespace codelang
