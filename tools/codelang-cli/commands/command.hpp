#pragma once

#include <codelang/codelang.hpp>
#include <CLI/CLI.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace codelang::cli {

/**
 * Context passed to command execution.
 * Holds the loaded model and run settings.
 */
struct CommandContext {
    ModelHandle model;
    Config config;
    Logger* logger = nullptr;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds and the model is loaded.
     *
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

/**
 * Buffer for a command's input: the file at `path`, or stdin when
 * `path` is empty or "-".
 */
inline std::unique_ptr<TextBuffer> open_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::make_unique<StreamBuffer>(std::cin);
    }
    return std::make_unique<FileBuffer>(path);
}

/**
 * Buffers for a list of input paths, in order. Every "-" shares one
 * buffer over `in`, so stdin is drained once and each later "-" sees
 * the same text. No paths means a single stdin buffer.
 */
inline std::vector<std::shared_ptr<TextBuffer>> open_inputs(
    const std::vector<std::string>& paths,
    std::istream& in = std::cin) {

    std::vector<std::shared_ptr<TextBuffer>> inputs;
    std::shared_ptr<TextBuffer> stdin_buffer;

    auto shared_stdin = [&]() {
        if (!stdin_buffer) {
            stdin_buffer = std::make_shared<StreamBuffer>(in);
        }
        return stdin_buffer;
    };

    if (paths.empty()) {
        inputs.push_back(shared_stdin());
        return inputs;
    }

    for (const auto& path : paths) {
        if (path == "-") {
            inputs.push_back(shared_stdin());
        } else {
            inputs.push_back(std::make_shared<FileBuffer>(path));
        }
    }
    return inputs;
}

// "<language padded to 14><total with 4 decimals>", formatted off std::cout
inline std::string format_score(const std::string& language, double total) {
    std::ostringstream ss;
    ss << std::left << std::setw(14) << language
       << std::right << std::fixed << std::setprecision(4) << total;
    return ss.str();
}

// "Error: <source>: <CODE>: <message>" on stderr
inline void report_error(const std::string& source, const Error& error) {
    std::cerr << "Error: " << source << ": " << error.to_string() << "\n";
}

}  // namespace codelang::cli
