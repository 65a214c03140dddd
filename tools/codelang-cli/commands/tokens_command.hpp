#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>

namespace codelang::cli {

/**
 * Print the token stream of a file and its vocabulary ids.
 * Useful when a snippet is misclassified.
 */
class TokensCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "tokens"; }
    std::string description() const override {
        return "Show how a file is tokenized and which tokens the model knows";
    }

private:
    std::string file_;
    bool known_only_ = false;
};

}  // namespace codelang::cli
