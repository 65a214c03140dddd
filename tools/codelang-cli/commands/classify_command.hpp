#pragma once

#include "command.hpp"
#include "exit_codes.hpp"
#include <string>
#include <vector>

namespace codelang::cli {

/**
 * Classify files (or stdin) and print the detected language.
 *
 * One input prints just the language; several print "file: language"
 * per line. --scores adds the top vote totals.
 */
class ClassifyCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "classify"; }
    std::string description() const override {
        return "Detect the programming language of files or stdin";
    }

private:
    std::vector<std::string> files_;
    bool scores_ = false;
    size_t top_n_ = 0;

    int classify_one(const Classifier& classifier, const TextBuffer& input,
                     bool show_name, size_t top_n);
};

}  // namespace codelang::cli
