#include "tokens_command.hpp"
#include <iomanip>

namespace codelang::cli {

void TokensCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "File to tokenize (stdin if omitted)")
        ->type_name("<file>");

    app.add_flag("-k,--known", known_only_, "Only list tokens found in the vocabulary");
}

int TokensCommand::execute(CommandContext& ctx) {
    auto input = open_input(file_);
    auto text = input->contents();
    if (!text.ok()) {
        report_error(input->name(), text.error());
        return exit_code_for(text.error_code());
    }

    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize(text.value());
    const auto& vocabulary = ctx.model->vocabulary();

    if (ctx.logger) {
        ctx.logger->debug(input->name() + ": " + std::to_string(tokenizer.singles(text.value()).size()) +
                          " single(s)");
    }

    size_t known = 0;
    for (const auto& token : tokens) {
        auto id = vocabulary.lookup(token);
        if (id) ++known;
        if (known_only_ && !id) continue;

        std::cout << std::left << std::setw(8);
        if (id) {
            std::cout << *id;
        } else {
            std::cout << "-";
        }
        std::cout << token << "\n";
    }

    std::cout << "\n" << tokens.size() << " token(s), " << known << " in vocabulary\n";
    return CODELANG_EXIT_SUCCESS;
}

}  // namespace codelang::cli
