#include <codelang/model.hpp>
#include <codelang/embedded_model.hpp>
#include <codelang/model_loader.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace codelang {

Result<ModelHandle> Model::create(Vocabulary vocabulary,
                                  Forest forest,
                                  LabelTable labels) {
    if (forest.label_count() != labels.size()) {
        return Error(ErrorCode::MALFORMED_MODEL,
                     "Forest votes over " + std::to_string(forest.label_count()) +
                     " labels but the label table has " + std::to_string(labels.size()));
    }

    for (size_t t = 0; t < forest.size(); ++t) {
        for (const auto& node : forest.trees()[t].nodes()) {
            const auto* internal = std::get_if<InternalNode>(&node);
            if (internal && !vocabulary.contains(internal->feature)) {
                return Error(ErrorCode::MALFORMED_MODEL,
                             "Tree " + std::to_string(t) + " tests unknown feature " +
                             std::to_string(internal->feature));
            }
        }
    }

    return ModelHandle(new Model(std::move(vocabulary), std::move(forest), std::move(labels)));
}

Result<ModelHandle> Model::embedded(Logger& logger) {
    static std::once_flag load_flag;
    static std::optional<Result<ModelHandle>> cached;

    std::call_once(load_flag, [&logger]() {
        cached.emplace(ModelLoader(logger).parse(embedded_model_json()));
        if (!cached->ok()) {
            logger.error("Embedded model rejected: " + cached->error().to_string());
        }
    });

    return *cached;
}

}  // namespace codelang
