#include "classify_command.hpp"

namespace codelang::cli {

void ClassifyCommand::setup(CLI::App& app) {
    app.add_option("files", files_, "Files to classify (stdin if omitted, '-' for stdin)")
        ->type_name("<file>");

    app.add_flag("-s,--scores", scores_, "Show the top vote totals");

    app.add_option("-n,--top", top_n_, "Number of vote totals for --scores (default: 5)")
        ->type_name("<num>");
}

int ClassifyCommand::execute(CommandContext& ctx) {
    Classifier classifier(ctx.model);
    size_t top_n = top_n_ > 0 ? top_n_ : ctx.config.top_n;

    if (ctx.logger) {
        ctx.logger->debug("Classifying " +
                          (files_.empty() ? std::string("<stdin>")
                                          : std::to_string(files_.size()) + " file(s)"));
    }

    bool show_name = files_.size() > 1;
    int status = CODELANG_EXIT_SUCCESS;

    for (const auto& input : open_inputs(files_)) {
        int rc = classify_one(classifier, *input, show_name, top_n);
        if (rc != CODELANG_EXIT_SUCCESS) {
            status = rc;  // keep going, report the last failure
        }
    }

    return status;
}

int ClassifyCommand::classify_one(const Classifier& classifier,
                                  const TextBuffer& input,
                                  bool show_name,
                                  size_t top_n) {
    auto text = input.contents();
    if (!text.ok()) {
        report_error(input.name(), text.error());
        return exit_code_for(text.error_code());
    }

    if (!scores_) {
        auto language = classifier.classify_text(text.value());
        if (!language.ok()) {
            report_error(input.name(), language.error());
            return exit_code_for(language.error_code());
        }

        if (show_name) std::cout << input.name() << ": ";
        std::cout << language.value() << "\n";
        return CODELANG_EXIT_SUCCESS;
    }

    auto prediction = classifier.explain(text.value(), top_n);
    if (!prediction.ok()) {
        report_error(input.name(), prediction.error());
        return exit_code_for(prediction.error_code());
    }

    const auto& p = prediction.value();
    if (show_name) std::cout << input.name() << ": ";
    std::cout << p.language << "\n";
    std::cout << "  tokens: " << p.token_count
              << " (" << p.recognized_count << " in vocabulary)\n";

    for (const auto& [language, total] : p.scores) {
        std::cout << "  " << format_score(language, total) << "\n";
    }

    return CODELANG_EXIT_SUCCESS;
}

}  // namespace codelang::cli
