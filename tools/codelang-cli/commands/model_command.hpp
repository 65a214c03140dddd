#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>

namespace codelang::cli {

/**
 * Summarize the loaded model.
 */
class ModelCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "model"; }
    std::string description() const override {
        return "Show vocabulary, forest and label statistics of the model";
    }

private:
    bool list_labels_ = false;
};

}  // namespace codelang::cli
