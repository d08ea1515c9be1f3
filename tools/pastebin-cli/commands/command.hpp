#pragma once

#include "exit_codes.hpp"

#include <pastebin/paste_store.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace pastebin::cli {

/**
 * Context passed to command execution.
 * Contains shared resources like the paste store.
 */
struct CommandContext {
    PasteStore* store = nullptr;
    bool verbose = false;
    std::filesystem::path store_path;
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
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with store and settings
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Store directory: $PASTEBIN_HOME, else ~/.pastebin, else ./.pastebin.
 */
inline std::filesystem::path get_default_store_path() {
    const char* env = std::getenv("PASTEBIN_HOME");
    if (env && env[0] != '\0') {
        return std::filesystem::path(env);
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::filesystem::path(home) / ".pastebin";
    }
    return ".pastebin";
}

/**
 * Print an error to stderr and return its exit code.
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Open the paste store.
 *
 * @param path Store directory path
 * @param verbose Log store activity to stderr
 */
inline Result<std::unique_ptr<PasteStore>> open_store(
    const std::filesystem::path& path,
    bool verbose = false
) {
    Config config;
    config.root_directory = path;
    config.verbose = verbose;
    return PasteStore::open(config);
}

/**
 * Read entire file content.
 * @return File content if successful, std::nullopt on error
 */
inline std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

/**
 * Read from stdin until EOF.
 */
inline std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

}  // namespace pastebin::cli
