#include "TokenizerProvider.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <memory>
#include <plog/Log.h>

namespace furigana
{

TokenizerProvider::TokenizerProvider(Factory factory, std::chrono::milliseconds wait_timeout)
    : factory_(std::move(factory))
    , wait_timeout_(wait_timeout)
{
}

TokenizerProvider::~TokenizerProvider() = default;

std::shared_future<TokenizerHandle> TokenizerProvider::initialize()
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (ready_)
    {
        std::promise<TokenizerHandle> done;
        done.set_value(ready_);
        return done.get_future().share();
    }

    if (inflight_.valid())
        return inflight_;

    ++build_attempts_;
    auto promise = std::make_shared<std::promise<TokenizerHandle>>();
    inflight_ = promise->get_future().share();

    // A previous failed attempt has already returned; joining it is immediate
    builder_ = std::jthread([this, promise] {
        PROFILE_THREAD_NAME("TokenizerBuild");
        promise->set_value(build());
    });

    PLOG_INFO << "Tokenizer build started (attempt " << build_attempts_.load() << ")";
    return inflight_;
}

TokenizerHandle TokenizerProvider::build()
{
    PROFILE_SCOPE_CUSTOM("TokenizerProvider::build");

    auto start = std::chrono::steady_clock::now();
    TokenizerHandle handle;
    try
    {
        if (factory_)
            handle = factory_();
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Tokenizer, "Failed to build tokenizer", ex.what());
        handle = nullptr;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    std::lock_guard<std::mutex> lock(mutex_);
    if (handle)
    {
        ready_ = handle;
        PLOG_INFO << "Tokenizer ready in " << elapsed.count() << "ms";
    }
    else
    {
        PLOG_WARNING << "Tokenizer build produced no tokenizer after " << elapsed.count()
                     << "ms; annotation continues without one";
    }
    inflight_ = std::shared_future<TokenizerHandle>();
    return handle;
}

bool TokenizerProvider::waitUntilReady()
{
    return waitUntilReady(wait_timeout_);
}

bool TokenizerProvider::waitUntilReady(std::chrono::milliseconds timeout)
{
    auto future = initialize();
    if (future.wait_for(timeout) != std::future_status::ready)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Tokenizer, "Tokenizer initialization timed out",
                                          "Waited " + std::to_string(timeout.count()) + "ms");
        return false;
    }
    return future.get() != nullptr;
}

TokenizerHandle TokenizerProvider::tokenizer() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_;
}

bool TokenizerProvider::isBuilding() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_.valid();
}

} // namespace furigana
