#pragma once

#include "domain/ApiError.hpp"
#include "domain/ClientStatus.hpp"
#include "ports/output/ITransport.hpp"
#include "settings/ApiClientConfig.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apiclient::application {

/**
 * @brief Ограниченный пул транспортных сессий одного upstream
 *
 * Сессии создаются лениво через ITransportFactory, пока active < maxSize.
 * Если свободных нет и лимит достигнут, acquire() ждёт освобождения
 * до timeout и бросает ConnectionExhaustedError. Повторов здесь нет,
 * решение принимает вызывающий код.
 *
 * Инвариант: количество созданных и не закрытых сессий <= maxSize
 * (кроме короткого окна после resize() вниз, пока сессии возвращаются).
 *
 * Thread-safe: да, один мьютекс на readySet и счётчик.
 */
class ConnectionPool {
public:
    /**
     * @brief Аренда сессии; при разрушении сессия возвращается в пул
     *
     * Пул должен пережить все выданные Lease.
     */
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<ports::output::ITransportSession> session)
            : pool_(pool), session_(std::move(session)) {}

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), session_(std::move(other.session_)) {
            other.pool_ = nullptr;
        }

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                reset();
                pool_ = other.pool_;
                session_ = std::move(other.session_);
                other.pool_ = nullptr;
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() { reset(); }

        ports::output::ITransportSession* operator->() const { return session_.get(); }
        ports::output::ITransportSession& operator*() const { return *session_; }
        explicit operator bool() const { return session_ != nullptr; }

        /**
         * @brief Вернуть сессию в пул досрочно
         */
        void reset() noexcept {
            if (pool_ && session_) {
                pool_->release(std::move(session_));
            }
            pool_ = nullptr;
        }

    private:
        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<ports::output::ITransportSession> session_;
    };

    ConnectionPool(
        std::shared_ptr<ports::output::ITransportFactory> factory,
        settings::UpstreamConfig upstream,
        settings::PoolConfig config
    );

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Получить сессию, ожидая не дольше PoolConfig::acquireTimeout
     * @throws domain::ConnectionExhaustedError
     */
    Lease acquire();

    /**
     * @throws domain::ConnectionExhaustedError
     */
    Lease acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Вернуть сессию
     *
     * Если readySet уже полон (пул уменьшили), сессия закрывается,
     * active уменьшается.
     */
    void release(std::unique_ptr<ports::output::ITransportSession> session) noexcept;

    /**
     * @brief Изменить лимит; лишние сессии закрываются по мере возврата
     */
    void resize(size_t maxSize);

    size_t active() const;
    size_t available() const;
    size_t maxSize() const;

    domain::ConnectionStats stats() const;

    const std::string& upstreamName() const { return upstream_.name; }

private:
    std::unique_ptr<ports::output::ITransportSession> createSession();

    std::shared_ptr<ports::output::ITransportFactory> factory_;
    settings::UpstreamConfig upstream_;
    settings::PoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::vector<std::unique_ptr<ports::output::ITransportSession>> ready_;
    size_t active_ = 0;
    size_t maxSize_;
};

} // namespace apiclient::application
