#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/WebhookSettings.hpp"
#include "settings/AnalysisClientSettings.hpp"
#include "settings/CallbackSettings.hpp"
#include "settings/WorkerPoolSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Ports
#include "ports/input/IWebhookDispatcher.hpp"
#include "ports/input/IAnalysisExecutor.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ISignatureCodec.hpp"
#include "ports/output/IJobRepository.hpp"
#include "ports/output/IAnalysisGateway.hpp"
#include "ports/output/ICallbackDeliveryClient.hpp"
#include "ports/output/IJobScheduler.hpp"

// Application
#include "application/WebhookDispatcher.hpp"
#include "application/AnalysisExecutor.hpp"
#include "application/CallbackDeliveryClient.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/HmacSha256SignatureCodec.hpp"
#include "adapters/secondary/InMemoryJobRepository.hpp"
#include "adapters/secondary/HttpAnalysisGateway.hpp"
#include "adapters/secondary/WorkerPoolJobScheduler.hpp"

// Primary Adapters
#include "adapters/primary/JobAnalysisWebhookHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RootHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace jobhook
{

    /**
     * @brief Webhook Service Application
     *
     * Принимает подписанные webhook'и анализа вакансий, выполняет анализ
     * синхронно или в пуле воркеров, результат async задач отправляет
     * подписанным callback'ом.
     */
    class WebhookApp : public BoostBeastApplication
    {
    public:
        WebhookApp() { std::cout << "[WebhookApp] Initializing..." << std::endl; }

        ~WebhookApp() override
        {
            std::cout << "[WebhookApp] Shutting down..." << std::endl;
            if (scheduler_)
            {
                scheduler_->stop();
            }
            if (executor_)
            {
                executor_->stop();
            }
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[WebhookApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[WebhookApp] Configuring DI..." << std::endl;

            // Шаг 1: пул воркеров, один экземпляр на всё приложение
            auto poolInjector = di::make_injector(
                di::bind<settings::WorkerPoolSettings>().in(di::singleton));
            scheduler_ = poolInjector.create<std::shared_ptr<adapters::secondary::WorkerPoolJobScheduler>>();

            // Шаг 2: основной injector
            auto injector = di::make_injector(
                di::bind<settings::IWebhookSettings>().to<settings::WebhookSettings>().in(di::singleton),
                di::bind<settings::IAnalysisClientSettings>().to<settings::AnalysisClientSettings>().in(di::singleton),
                di::bind<settings::ICallbackSettings>().to<settings::CallbackSettings>().in(di::singleton),
                di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),

                di::bind<ports::output::ISignatureCodec>().to<adapters::secondary::HmacSha256SignatureCodec>().in(di::singleton),
                di::bind<ports::output::IJobRepository>().to<adapters::secondary::InMemoryJobRepository>().in(di::singleton),
                di::bind<ports::output::IAnalysisGateway>().to<adapters::secondary::HttpAnalysisGateway>().in(di::singleton),
                di::bind<ports::output::IJobScheduler>().to(scheduler_),

                di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
                di::bind<ports::input::IAnalysisExecutor>().to<application::AnalysisExecutor>().in(di::singleton),
                di::bind<ports::output::ICallbackDeliveryClient>().to<application::CallbackDeliveryClient>().in(di::singleton),
                di::bind<ports::input::IWebhookDispatcher>().to<application::WebhookDispatcher>().in(di::singleton));

            // Исполнитель останавливается явно, после пула воркеров
            executor_ = std::dynamic_pointer_cast<application::AnalysisExecutor>(
                injector.create<std::shared_ptr<ports::input::IAnalysisExecutor>>());

            auto metrics = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
            auto withMetrics = [&metrics](std::shared_ptr<IHttpHandler> handler)
            {
                return std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics);
            };

            // Шаг 3: HTTP Handlers
            auto healthHandler = withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
            handlers_[getHandlerKey("GET", "/health")] = healthHandler;
            handlers_[getHandlerKey("GET", "/api/v1/webhooks/health")] = healthHandler;

            handlers_[getHandlerKey("GET", "/")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::RootHandler>>());
            handlers_[getHandlerKey("GET", "/metrics")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());
            handlers_[getHandlerKey("POST", "/api/v1/webhooks/job-analysis")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::JobAnalysisWebhookHandler>>());

            // Шаг 4: запускаем воркеры после регистрации всех handlers
            std::cout << "[WebhookApp] Starting worker pool..." << std::endl;
            scheduler_->start();

            std::cout << "[WebhookApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::WorkerPoolJobScheduler> scheduler_;
        std::shared_ptr<application::AnalysisExecutor> executor_;
    };

} // namespace jobhook
