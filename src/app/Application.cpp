#include "Application.hpp"
#include "OutputFormatter.hpp"
#include "config/ConfigManager.hpp"
#include "config/FuriganaSettings.hpp"
#include "furigana/Diagnostics.hpp"
#include "furigana/FuriganaEngine.hpp"
#include "furigana/MeCabTokenizer.hpp"
#include "furigana/TokenizerProvider.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <vector>

#include <plog/Log.h>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() = default;

int Application::run()
{
    PROFILE_SCOPE_FUNCTION();

    if (!parseCommandLineArgs())
    {
        std::cerr << usageText();
        flushErrors();
        return 1;
    }

    if (options_.show_help)
    {
        std::cout << usageText();
        return 0;
    }

    initializeConfig();

    if (!initializeLogging())
    {
        flushErrors();
        return 1;
    }

    auto text = readInput();
    if (!text)
    {
        flushErrors();
        return 1;
    }

    int code = process(*text);
    flushErrors();
    return code;
}

bool Application::parseCommandLineArgs()
{
    std::vector<std::string> args;
    for (int i = 1; i < argc_; ++i)
        args.emplace_back(argv_[i]);

    std::string error;
    if (!parseCommandLine(args, options_, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Invalid command line", error);
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    utils::LogManager::Options log_options;
    log_options.append = settings_->appendLogs();
    log_options.level = static_cast<plog::Severity>(settings_->loggingLevel());

    if (!utils::LogManager::Initialize(log_options))
        return false;

    const auto diagnostics_level = settings_->verbose() ? plog::verbose : log_options.level;
    if (!utils::LogManager::AddChannel<0>("run.log") ||
        !utils::LogManager::AddChannel<furigana::Diagnostics::kLogInstance>("diagnostics.log", diagnostics_level))
        return false;

#if FURIGANA_PROFILING_LEVEL >= 1
    utils::LogManager::AddChannel<profiling::kProfilingLogInstance>("profiling.log", plog::debug);
#endif

    furigana::Diagnostics::SetVerbose(settings_->verbose() || settings_->loggingLevel() >= plog::debug);

    PLOG_INFO << "furigana started, config=" << options_.config_path;
    PLOG_INFO << "Settings: notation=" << furigana::notationStyleToString(settings_->notationStyle())
              << " reading_mode=" << settings_->readingMode() << " editing_mode=" << settings_->editingMode()
              << " format=" << outputFormatToString(options_.format);
    return true;
}

// Settings load before logging exists, so load problems reach the user through ErrorReporter only
void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    settings_ = std::make_unique<FuriganaSettings>();
    settings_->registerConfigHandler(*config_);

    if (!config_->load())
        settings_->applyDefaults();

    SettingsPatch patch;
    patch.notation = options_.notation;
    patch.dictionary_dir = options_.dictionary_dir;
    if (options_.verbose)
        patch.verbose = true;
    settings_->applyPatch(patch);
}

void Application::initializeTokenizer()
{
    PROFILE_SCOPE_FUNCTION();

    furigana::MeCabTokenizer::Options mecab;
    mecab.dictionary_dir = settings_->dictionaryDir();
    mecab.reading_field = settings_->readingField();

    provider_ = std::make_unique<furigana::TokenizerProvider>(
        [mecab]() -> furigana::TokenizerHandle { return furigana::MeCabTokenizer::create(mecab); },
        std::chrono::milliseconds(settings_->initTimeoutMs()));

    if (!provider_->waitUntilReady())
        PLOG_WARNING << "Continuing without a tokenizer; automatic spans carry no readings";
}

std::optional<std::string> Application::readInput()
{
    if (!options_.input_path)
    {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        return oss.str();
    }

    std::ifstream ifs(*options_.input_path, std::ios::binary);
    if (!ifs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Cannot open input file",
                                          *options_.input_path);
        return std::nullopt;
    }

    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to read input file",
                                          *options_.input_path);
        return std::nullopt;
    }
    return text;
}

int Application::process(const std::string& text)
{
    const bool viewport = !options_.visible.empty();
    const bool enabled = viewport ? settings_->editingMode() : settings_->readingMode();

    std::vector<furigana::ResolvedSpan> spans;
    if (enabled)
    {
        initializeTokenizer();

        furigana::AnnotationOptions annotation;
        annotation.notation = settings_->notationStyle();
        annotation.selections = options_.selections;

        furigana::FuriganaEngine engine(provider_.get());
        spans = viewport ? engine.annotateVisible(text, options_.visible, annotation)
                         : engine.annotate(text, annotation);
    }
    else
    {
        PLOG_INFO << (viewport ? "editing_mode" : "reading_mode") << " is off; passing input through";
    }

    std::cout << formatOutput(options_.format, text, spans, enabled);
    std::cout.flush();
    if (!std::cout)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to write output", "stdout");
        return 1;
    }
    return 0;
}

void Application::flushErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << "furigana: " << utils::ErrorReporter::Format(report) << '\n';
}
