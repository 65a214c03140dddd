#pragma once

#include <codelang/forest.hpp>
#include <codelang/label_table.hpp>
#include <codelang/result.hpp>
#include <codelang/util/logger.hpp>
#include <codelang/vocabulary.hpp>

#include <memory>

namespace codelang {

class Model;

// Shared read-only handle; a loaded model never changes
using ModelHandle = std::shared_ptr<const Model>;

/**
 * The trained classifier: vocabulary, forest and label table.
 *
 * Only constructible through create(), which checks that every
 * internal node tests a vocabulary feature and every leaf votes for a
 * label in the table. A Model that exists is valid.
 */
class Model {
public:
    static Result<ModelHandle> create(Vocabulary vocabulary,
                                      Forest forest,
                                      LabelTable labels);

    /**
     * Model compiled into the library, parsed on first use.
     *
     * Parsing happens exactly once per process even under concurrent
     * first calls. A parse failure is cached too: every call returns
     * the same MALFORMED_MODEL error and no classification is served.
     *
     * @param logger Receives load messages; only the first call's
     *               logger is used
     */
    static Result<ModelHandle> embedded(Logger& logger = null_logger());

    const Vocabulary& vocabulary() const { return vocabulary_; }
    const Forest& forest() const { return forest_; }
    const LabelTable& labels() const { return labels_; }

private:
    Model(Vocabulary vocabulary, Forest forest, LabelTable labels)
        : vocabulary_(std::move(vocabulary)),
          forest_(std::move(forest)),
          labels_(std::move(labels)) {}

    Vocabulary vocabulary_;
    Forest forest_;
    LabelTable labels_;
};

}  // namespace codelang
