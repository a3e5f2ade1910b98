#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace apiclient::application {

/**
 * @brief Фоновый поток, выполняющий задачу с заданным интервалом
 *
 * Первый запуск - через interval после start(). stop() будит
 * поток через condition_variable и дожидается его завершения,
 * не дожидаясь окончания текущего интервала.
 *
 * @example
 * ```cpp
 * PeriodicTask compaction("metrics-compaction", 300s, [&] { metrics.compact(); });
 * compaction.start();
 * // ...
 * compaction.stop();
 * ```
 *
 * Thread-safe: да
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body)
        : name_(std::move(name))
        , interval_(interval)
        , body_(std::move(body))
    {}

    ~PeriodicTask() {
        stop();
    }

    // Non-copyable, non-movable
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        if (running_.exchange(true)) {
            return;  // Уже запущен
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = false;
        }

        workerThread_ = std::thread([this]() {
            runLoop();
        });
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;  // Уже остановлен
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = true;
        }
        wakeUp_.notify_all();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t runCount() const {
        return runCount_.load();
    }

    const std::string& name() const { return name_; }

private:
    void runLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopRequested_) {
            if (wakeUp_.wait_for(lock, interval_, [this] { return stopRequested_; })) {
                break;
            }

            lock.unlock();
            try {
                body_();
            } catch (const std::exception& e) {
                std::cerr << "[PeriodicTask:" << name_ << "] error: " << e.what() << std::endl;
            }
            ++runCount_;
            lock.lock();
        }
    }

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> body_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> runCount_{0};
    std::thread workerThread_;

    std::mutex mutex_;
    std::condition_variable wakeUp_;
    bool stopRequested_ = false;
};

} // namespace apiclient::application
