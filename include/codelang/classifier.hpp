#pragma once

#include <codelang/model.hpp>
#include <codelang/result.hpp>
#include <codelang/text_buffer.hpp>
#include <codelang/tokenizer.hpp>

#include <string>
#include <utility>
#include <vector>

namespace codelang {

// Label plus the evidence behind it
struct Prediction {
    std::string language;
    size_t token_count = 0;       // T: singles + pairs
    size_t recognized_count = 0;  // tokens found in the vocabulary
    std::vector<std::pair<std::string, double>> scores;  // top vote totals, best first
};

/**
 * Maps text to a language symbol with a loaded model.
 *
 * Stateless apart from the shared read-only model, so one instance
 * may be used from any number of threads at once.
 */
class Classifier {
public:
    explicit Classifier(ModelHandle model);

    /**
     * Classify a text snippet.
     *
     * @return Language symbol, or EMPTY_INPUT if the text has no tokens
     *         (empty or whitespace only)
     */
    Result<std::string> classify_text(const std::string& text) const;

    // Read the whole buffer, then classify_text()
    Result<std::string> classify_buffer(const TextBuffer& source) const;

    // classify_text() with token statistics and the top_n vote totals
    Result<Prediction> explain(const std::string& text, size_t top_n = 5) const;

    const Model& model() const { return *model_; }

private:
    ModelHandle model_;
    Tokenizer tokenizer_;
};

// Classify with the embedded model
Result<std::string> classify_text(const std::string& text);

Result<std::string> classify_buffer(const TextBuffer& source);

}  // namespace codelang
