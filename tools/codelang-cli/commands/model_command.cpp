#include "model_command.hpp"
#include <algorithm>

namespace codelang::cli {

void ModelCommand::setup(CLI::App& app) {
    app.add_flag("-l,--labels", list_labels_, "List every language label");
}

int ModelCommand::execute(CommandContext& ctx) {
    const Model& model = *ctx.model;

    size_t nodes = 0;
    size_t leaves = 0;
    size_t max_depth = 0;
    for (const auto& tree : model.forest().trees()) {
        nodes += tree.node_count();
        leaves += tree.leaf_count();
        max_depth = std::max(max_depth, tree.depth());
    }

    std::cout << "Source:     "
              << (ctx.config.model_path.empty() ? std::string("<embedded>")
                                                : ctx.config.model_path.string())
              << "\n";
    std::cout << "Vocabulary: " << model.vocabulary().size() << " tokens\n";
    std::cout << "Forest:     " << model.forest().size() << " trees, "
              << nodes << " nodes, " << leaves << " leaves, max depth " << max_depth << "\n";
    std::cout << "Labels:     " << model.labels().size() << "\n";

    if (list_labels_) {
        const auto& symbols = model.labels().symbols();
        for (size_t id = 0; id < symbols.size(); ++id) {
            std::cout << "  " << id << "\t" << symbols[id] << "\n";
        }
    }

    return CODELANG_EXIT_SUCCESS;
}

}  // namespace codelang::cli
