#pragma once

#include <codelang/model.hpp>
#include <codelang/result.hpp>
#include <codelang/util/logger.hpp>

#include <filesystem>
#include <string>

namespace codelang {

/**
 * Parses the JSON model asset into a validated Model.
 *
 * Asset layout:
 *   {
 *     "vocabulary": [[token, id], ...],
 *     "forest":     [tree, ...],
 *     "labels":     [[id, symbol], ...]
 *   }
 *
 * A tree node is an array: [feature_id, threshold, left, right] for an
 * internal node, [label_id, weight] for a leaf. Arity is resolved here
 * into InternalNode / LeafNode; nothing downstream looks at it again.
 *
 * Every failure is reported as MALFORMED_MODEL (NOT_FOUND / IO_ERROR
 * for files that cannot be read).
 */
class ModelLoader {
public:
    // Deepest tree accepted; guards the recursive flattening
    static constexpr size_t MAX_TREE_DEPTH = 2048;

    explicit ModelLoader(Logger& logger = null_logger());

    Result<ModelHandle> parse(const std::string& json_text) const;

    Result<ModelHandle> load_file(const std::filesystem::path& path) const;

private:
    Logger& logger_;
};

}  // namespace codelang
