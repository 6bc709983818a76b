#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <iostream>

namespace jobhook::adapters::primary
{

    /**
     * @brief Декоратор для подсчёта HTTP метрик
     *
     * Метрика: http_requests_total{method="...",path="..."}, path без query string.
     */
    class MetricsDecoratorHandler : public IHttpHandler
    {
    public:
        MetricsDecoratorHandler(
            std::shared_ptr<IHttpHandler> inner,
            std::shared_ptr<ports::input::IMetricsService> metrics) : inner_(std::move(inner)), metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string path = req.getPath();
            size_t queryPos = path.find('?');
            if (queryPos != std::string::npos)
            {
                path = path.substr(0, queryPos);
            }

            // Считаем входящие запросы, до обработки
            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", path}});

            inner_->handle(req, res);
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
    };

} // namespace jobhook::adapters::primary
