#pragma once

#include "CommandLine.hpp"

#include <memory>
#include <optional>
#include <string>

class ConfigManager;
class FuriganaSettings;

namespace furigana
{
class TokenizerProvider;
}

/**
 * @brief Command-line front end: one document in, annotated output out.
 *
 * run() wires logging, settings, the tokenizer provider and the engine, then
 * prints the result in the requested format. Exit code 0 on success, 1 on
 * usage or I/O errors; pending ErrorReporter entries go to stderr either way.
 */
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool parseCommandLineArgs();
    bool initializeLogging();
    void initializeConfig();
    void initializeTokenizer();
    std::optional<std::string> readInput();
    int process(const std::string& text);
    void flushErrors();

    CommandLineOptions options_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<FuriganaSettings> settings_;
    std::unique_ptr<furigana::TokenizerProvider> provider_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
