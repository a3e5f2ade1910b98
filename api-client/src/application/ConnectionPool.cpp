#include "application/ConnectionPool.hpp"
#include <iostream>

namespace apiclient::application {

ConnectionPool::ConnectionPool(
    std::shared_ptr<ports::output::ITransportFactory> factory,
    settings::UpstreamConfig upstream,
    settings::PoolConfig config
) : factory_(std::move(factory))
  , upstream_(std::move(upstream))
  , config_(config)
  , maxSize_(config.maxSize)
{
    std::cout << "[ConnectionPool:" << upstream_.name << "] Created, maxSize=" << maxSize_
              << " target: " << upstream_.host << ":" << upstream_.port << std::endl;
}

ConnectionPool::~ConnectionPool() {
    std::vector<std::unique_ptr<ports::output::ITransportSession>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        toClose.swap(ready_);
        active_ = 0;
    }
    for (auto& session : toClose) {
        session->close();
    }
}

ConnectionPool::Lease ConnectionPool::acquire() {
    return acquire(config_.acquireTimeout);
}

ConnectionPool::Lease ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!ready_.empty()) {
            auto session = std::move(ready_.back());
            ready_.pop_back();
            return Lease(this, std::move(session));
        }

        if (active_ < maxSize_) {
            ++active_;
            lock.unlock();
            try {
                return Lease(this, createSession());
            } catch (...) {
                {
                    std::lock_guard<std::mutex> relock(mutex_);
                    --active_;
                }
                released_.notify_one();
                throw;
            }
        }

        if (released_.wait_until(lock, deadline) == std::cv_status::timeout
            && ready_.empty() && active_ >= maxSize_) {
            std::cerr << "[ConnectionPool:" << upstream_.name << "] Exhausted after "
                      << timeout.count() << "ms, active=" << active_ << std::endl;
            throw domain::ConnectionExhaustedError(
                "Connection pool exhausted for " + upstream_.name);
        }
    }
}

void ConnectionPool::release(std::unique_ptr<ports::output::ITransportSession> session) noexcept {
    if (!session) {
        return;
    }

    bool discard = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_.size() >= maxSize_ || active_ > maxSize_) {
            discard = true;
            if (active_ > 0) {
                --active_;
            }
        } else {
            ready_.push_back(std::move(session));
        }
    }

    if (discard) {
        try {
            session->close();
        } catch (const std::exception& e) {
            std::cerr << "[ConnectionPool:" << upstream_.name << "] close error: " << e.what() << std::endl;
        }
    }
    released_.notify_one();
}

void ConnectionPool::resize(size_t maxSize) {
    std::vector<std::unique_ptr<ports::output::ITransportSession>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maxSize_ = maxSize;
        while (ready_.size() > maxSize_) {
            toClose.push_back(std::move(ready_.back()));
            ready_.pop_back();
            --active_;
        }
    }
    for (auto& session : toClose) {
        session->close();
    }
    released_.notify_all();
}

size_t ConnectionPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t ConnectionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size();
}

size_t ConnectionPool::maxSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxSize_;
}

domain::ConnectionStats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {active_, ready_.size(), maxSize_};
}

std::unique_ptr<ports::output::ITransportSession> ConnectionPool::createSession() {
    auto session = factory_->openSession(upstream_);
    session->setDefaultHeader("Content-Type", "application/json");
    session->setDefaultHeader("Accept", "application/json");
    session->setDefaultHeader("User-Agent", upstream_.userAgent);
    return session;
}

} // namespace apiclient::application
