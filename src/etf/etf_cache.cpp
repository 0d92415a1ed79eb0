#include "etf/etf_cache.hpp"

#include <iostream>

EtfCache::EtfCache(Builder builder, std::function<Clock::time_point()> now)
    : builder_(std::move(builder))
    , now_(std::move(now)) {}

std::shared_ptr<const EtfSnapshot> EtfCache::getOrRefresh(std::chrono::seconds maxAge) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = now_();
    if (snapshot_ && now - snapshot_->builtAt <= maxAge) {
        return snapshot_;
    }

    auto built = builder_();
    if (!built) {
        std::cerr << "Error: ETF refresh failed" << (snapshot_ ? ", keeping previous snapshot" : "") << std::endl;
        return nullptr;
    }

    auto snapshot     = std::make_shared<EtfSnapshot>();
    snapshot->result  = std::move(built);
    snapshot->builtAt = now;
    snapshot_         = snapshot;
    return snapshot_;
}

std::shared_ptr<const EtfSnapshot> EtfCache::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}
