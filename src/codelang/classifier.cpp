#include <codelang/classifier.hpp>
#include <codelang/frequency_vector.hpp>

#include <stdexcept>

namespace codelang {

Classifier::Classifier(ModelHandle model)
    : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("Classifier requires a model");
    }
}

Result<std::string> Classifier::classify_text(const std::string& text) const {
    auto vector = vectorize(tokenizer_.tokenize(text), model_->vocabulary());
    if (!vector.ok()) {
        return vector.error();
    }

    LabelId label = model_->forest().predict(vector.value());
    return model_->labels().resolve(label);
}

Result<std::string> Classifier::classify_buffer(const TextBuffer& source) const {
    auto text = source.contents();
    if (!text.ok()) {
        return text.error();
    }
    return classify_text(text.value());
}

Result<Prediction> Classifier::explain(const std::string& text, size_t top_n) const {
    auto vector = vectorize(tokenizer_.tokenize(text), model_->vocabulary());
    if (!vector.ok()) {
        return vector.error();
    }

    VoteTally votes = model_->forest().tally(vector.value());

    auto language = model_->labels().resolve(votes.winner());
    if (!language.ok()) {
        return language.error();
    }

    Prediction prediction;
    prediction.language = std::move(language).value();
    prediction.token_count = vector.value().token_count();
    prediction.recognized_count = vector.value().recognized_count();

    for (const auto& [label, total] : votes.ranked()) {
        if (prediction.scores.size() >= top_n) break;
        auto symbol = model_->labels().resolve(label);
        if (!symbol.ok()) {
            return symbol.error();
        }
        prediction.scores.emplace_back(std::move(symbol).value(), total);
    }

    return prediction;
}

Result<std::string> classify_text(const std::string& text) {
    auto model = Model::embedded();
    if (!model.ok()) {
        return model.error();
    }
    return Classifier(model.value()).classify_text(text);
}

Result<std::string> classify_buffer(const TextBuffer& source) {
    auto text = source.contents();
    if (!text.ok()) {
        return text.error();
    }
    return classify_text(text.value());
}

}  // namespace codelang
