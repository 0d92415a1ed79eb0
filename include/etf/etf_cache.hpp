#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include "etf/etf_pipeline.hpp"

struct EtfSnapshot {
    std::shared_ptr<const EtfResult>      result;
    std::chrono::steady_clock::time_point builtAt;
};

/**
 * @brief Owns the latest pipeline result and rebuilds it when it gets too old.
 *
 * Refreshes are serialized: concurrent callers of getOrRefresh() block on the
 * same mutex, so at most one build runs and late callers reuse its snapshot.
 */
class EtfCache {
   public:
    using Clock   = std::chrono::steady_clock;
    using Builder = std::function<std::shared_ptr<EtfResult>()>;

    /**
     * @param builder Runs the pipeline; returns nullptr on failure.
     * @param now     Clock source (defaults to steady_clock::now).
     */
    explicit EtfCache(Builder builder, std::function<Clock::time_point()> now = Clock::now);

    /**
     * @brief Current snapshot, rebuilt first when missing or older than maxAge.
     * @return Snapshot, or nullptr when a required rebuild failed. A failed rebuild
     *         leaves the previous snapshot in place.
     */
    [[nodiscard]] std::shared_ptr<const EtfSnapshot> getOrRefresh(std::chrono::seconds maxAge);

    /**
     * @brief Last snapshot without refreshing, nullptr before the first build.
     */
    [[nodiscard]] std::shared_ptr<const EtfSnapshot> current() const;

   private:
    Builder                            builder_;
    std::function<Clock::time_point()> now_;

    mutable std::mutex                 mutex_;
    std::shared_ptr<const EtfSnapshot> snapshot_;
};
