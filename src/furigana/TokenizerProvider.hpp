#pragma once

#include "ITokenizer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

namespace furigana
{

/**
 * @brief Owns the lazily built tokenizer and guarantees it is built once.
 *
 * The first initialize() starts the build on a background thread. Callers that
 * arrive while it runs share the same future instead of starting another
 * build. A failed build (factory returned null or threw) clears the in-flight
 * state so a later call can retry. Once built, the handle is immutable and can
 * be read without further synchronization by whoever holds it.
 *
 * Usage:
 *   TokenizerProvider provider([] { return MeCabTokenizer::create({}); });
 *   provider.initialize();              // kick off early, never blocks
 *   ...
 *   if (provider.waitUntilReady())      // bounded wait
 *       engine.annotate(...);
 */
class TokenizerProvider
{
public:
    using Factory = std::function<TokenizerHandle()>;

    static constexpr std::chrono::milliseconds kDefaultWaitTimeout{ 10000 };

    explicit TokenizerProvider(Factory factory, std::chrono::milliseconds wait_timeout = kDefaultWaitTimeout);
    ~TokenizerProvider();

    TokenizerProvider(const TokenizerProvider&) = delete;
    TokenizerProvider& operator=(const TokenizerProvider&) = delete;

    /// Start the build unless one is done or running; returns the shared result
    std::shared_future<TokenizerHandle> initialize();

    /// initialize() and wait up to the configured timeout.
    /// Returns false (and reports it) on timeout or failed build.
    bool waitUntilReady();
    bool waitUntilReady(std::chrono::milliseconds timeout);

    /// Built tokenizer, or null while absent
    [[nodiscard]] TokenizerHandle tokenizer() const;

    [[nodiscard]] bool isBuilding() const;
    [[nodiscard]] std::size_t buildAttempts() const noexcept { return build_attempts_.load(); }
    [[nodiscard]] std::chrono::milliseconds waitTimeout() const noexcept { return wait_timeout_; }

private:
    TokenizerHandle build();

    Factory factory_;
    std::chrono::milliseconds wait_timeout_;
    mutable std::mutex mutex_;
    TokenizerHandle ready_;
    std::shared_future<TokenizerHandle> inflight_;
    std::atomic<std::size_t> build_attempts_{ 0 };
    std::jthread builder_; // last member: joined before the state above goes away
};

} // namespace furigana
