#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/EnvApiClientSettings.hpp"

// Ports
#include "ports/input/IApiClient.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ISharedCache.hpp"
#include "ports/output/ISystemMonitor.hpp"
#include "ports/output/ITransport.hpp"

// Application
#include "application/ApiClientRuntime.hpp"

// Secondary Adapters
#include "adapters/secondary/HealthProbes.hpp"
#include "adapters/secondary/HttpClientTransport.hpp"
#include "adapters/secondary/InMemorySharedCache.hpp"
#include "adapters/secondary/ProcSystemMonitor.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/StatusHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace apiclient
{

    /**
     * @brief Сервис-обёртка над ApiClientRuntime
     *
     * HTTP: GET /health, GET /api/v1/status
     * Фоновые задачи runtime запускаются в configureInjection()
     * и останавливаются в деструкторе.
     */
    class ApiClientApp : public BoostBeastApplication
    {
    public:
        ApiClientApp() { std::cout << "[ApiClientApp] Initializing..." << std::endl; }

        ~ApiClientApp() override
        {
            if (runtime_) {
                runtime_->stop();
            }
            std::cout << "[ApiClientApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[ApiClientApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[ApiClientApp] Configuring DI..." << std::endl;

            // Шаг 1: Runtime и его порты
            auto runtimeInjector = di::make_injector(
                di::bind<settings::IApiClientSettings>().to<settings::EnvApiClientSettings>().in(di::singleton),
                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::ITransportFactory>().to<adapters::secondary::HttpClientTransportFactory>().in(di::singleton),
                di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),
                di::bind<ports::output::ISharedCache>().to<adapters::secondary::InMemorySharedCache>().in(di::singleton),
                di::bind<ports::output::ISystemMonitor>().to(std::make_shared<adapters::secondary::ProcSystemMonitor>()));

            runtime_ = runtimeInjector.create<std::shared_ptr<application::ApiClientRuntime>>();

            // Шаг 2: Health probes используют те же singleton адаптеры
            auto transportFactory = runtimeInjector.create<std::shared_ptr<ports::output::ITransportFactory>>();
            auto sharedCache = runtimeInjector.create<std::shared_ptr<ports::output::ISharedCache>>();

            const auto& config = runtime_->config();
            runtime_->addHealthProbe(std::make_shared<adapters::secondary::HttpHealthProbe>(transportFactory, config.api));
            if (config.panel) {
                runtime_->addHealthProbe(std::make_shared<adapters::secondary::HttpHealthProbe>(transportFactory, *config.panel));
            }
            runtime_->addHealthProbe(std::make_shared<adapters::secondary::SharedCacheHealthProbe>(sharedCache));

            // Шаг 3: HTTP Handlers с instance binding для runtime
            std::shared_ptr<ports::input::IApiClient> client = runtime_;
            auto injector = di::make_injector(
                di::bind<ports::input::IApiClient>().to(client));

            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/status")] = injector.create<std::shared_ptr<adapters::primary::StatusHandler>>();

            // Шаг 4: Фоновые задачи
            runtime_->start();

            std::cout << "[ApiClientApp] Ready, " << handlers_.size() << " routes registered" << std::endl;
        }

    private:
        std::shared_ptr<application::ApiClientRuntime> runtime_;
    };

} // namespace apiclient
