#include "adapters/secondary/HttpClientTransport.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace apiclient::adapters::secondary {

/**
 * @brief Состояние одного вызова, разделяемое с рабочим потоком
 */
struct HttpClientTransport::Exchange {
    explicit Exchange(SimpleRequest req) : request(std::move(req)) {}

    SimpleRequest request;
    SimpleResponse response;
    std::promise<bool> done;
};

namespace {

// Заголовки ответа, которые нужны классификатору
const char* const RESPONSE_HEADERS[] = {"Content-Type", "Retry-After"};

bool mentionsTimeout(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("timeout") != std::string::npos || lower.find("timed out") != std::string::npos;
}

} // namespace

HttpClientTransport::HttpClientTransport(
    std::shared_ptr<IHttpClient> httpClient,
    settings::UpstreamConfig upstream
) : httpClient_(std::move(httpClient))
  , upstream_(std::move(upstream))
{
    worker_ = std::thread([this]() { workerLoop(); });
}

HttpClientTransport::~HttpClientTransport() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_.notify_all();
    idle_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void HttpClientTransport::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_.wait(lock, [this]() { return pending_ || stopping_; });
        if (stopping_) {
            return;
        }

        auto exchange = std::move(pending_);
        lock.unlock();
        try {
            exchange->done.set_value(httpClient_->send(exchange->request, exchange->response));
        } catch (...) {
            // Исключение доставляется вызывающему потоку через future
            exchange->done.set_exception(std::current_exception());
        }
        lock.lock();

        busy_ = false;
        idle_.notify_all();
    }
}

ports::output::TransportResponse HttpClientTransport::send(const ports::output::TransportRequest& request) {
    auto deadline = std::chrono::steady_clock::now() + request.timeout;

    std::map<std::string, std::string> headers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw ports::output::TransportConnectionError("session closed");
        }
        headers = defaultHeaders_;
    }
    for (const auto& [name, value] : request.headers) {
        headers[name] = value;
    }

    auto exchange = std::make_shared<Exchange>(SimpleRequest(
        request.method,
        buildTarget(request.path, request.params),
        request.body,
        upstream_.host,
        upstream_.port,
        headers
    ));
    auto result = exchange->done.get_future();

    {
        std::unique_lock<std::mutex> lock(mutex_);
        // Предыдущий вызов мог пережить свой таймаут, второй параллельно не запускаем
        if (!idle_.wait_until(lock, deadline, [this]() { return !busy_ || stopping_; })) {
            std::cerr << "[HttpClientTransport:" << upstream_.name << "] " << request.method << " "
                      << request.path << " rejected: previous call still in flight" << std::endl;
            throw ports::output::TransportTimeoutError(
                request.method + " " + request.path + " timed out waiting for previous call on session");
        }
        if (stopping_) {
            throw ports::output::TransportConnectionError("session closed");
        }
        busy_ = true;
        pending_ = exchange;
    }
    work_.notify_one();

    if (result.wait_until(deadline) != std::future_status::ready) {
        throw ports::output::TransportTimeoutError(
            request.method + " " + request.path + " timed out after "
            + std::to_string(request.timeout.count()) + "ms");
    }

    bool sent = false;
    try {
        sent = result.get();
    } catch (const std::exception& e) {
        if (mentionsTimeout(e.what())) {
            throw ports::output::TransportTimeoutError(e.what());
        }
        throw ports::output::TransportConnectionError(e.what());
    }

    if (!sent) {
        throw ports::output::TransportConnectionError(
            "failed to send request to " + upstream_.host + ":" + std::to_string(upstream_.port));
    }

    ports::output::TransportResponse response;
    response.statusCode = exchange->response.getStatus();
    response.body = exchange->response.getBody();
    for (const char* name : RESPONSE_HEADERS) {
        if (auto value = exchange->response.getHeader(name)) {
            response.headers[name] = *value;
        }
    }
    return response;
}

void HttpClientTransport::setDefaultHeader(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultHeaders_[name] = value;
}

domain::Headers HttpClientTransport::defaultHeaders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultHeaders_;
}

void HttpClientTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool HttpClientTransport::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool HttpClientTransport::isBusy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

std::string HttpClientTransport::buildTarget(const std::string& path, const domain::Params& params) {
    if (params.empty()) {
        return path;
    }

    std::string target = path + "?";
    bool first = true;
    for (const auto& [name, value] : params) {
        if (!first) {
            target += "&";
        }
        target += urlEncode(name) + "=" + urlEncode(value);
        first = false;
    }
    return target;
}

std::string HttpClientTransport::urlEncode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

} // namespace apiclient::adapters::secondary
