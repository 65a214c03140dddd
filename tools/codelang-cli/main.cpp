#include "commands/classify_command.hpp"
#include "commands/model_command.hpp"
#include "commands/tokens_command.hpp"

#include <memory>
#include <utility>
#include <vector>

using namespace codelang;
using namespace codelang::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"codelang - guess the programming language of source text"};
    app.require_subcommand(1);

    // Environment first, command line overrides
    Config config = Config::from_environment();

    std::string model_path;
    bool verbose = false;
    app.add_option("-m,--model", model_path, "Model JSON file (default: embedded model)")
        ->type_name("<path>");
    app.add_flag("-v,--verbose", verbose, "Log model loading details to stderr");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ClassifyCommand>());
    commands.push_back(std::make_unique<TokensCommand>());
    commands.push_back(std::make_unique<ModelCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    CLI11_PARSE(app, argc, argv);

    if (!model_path.empty()) config.model_path = model_path;
    if (verbose) config.verbose = true;

    ConsoleLogger logger;
    logger.set_min_level(config.verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    auto model = load_model(config, logger);
    if (!model.ok()) {
        report_error("model", model.error());
        return exit_code_for(model.error_code());
    }

    CommandContext ctx;
    ctx.model = model.value();
    ctx.config = config;
    ctx.logger = &logger;

    for (auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            return command->execute(ctx);
        }
    }

    std::cerr << app.help();
    return CODELANG_EXIT_USER_ERROR;
}
