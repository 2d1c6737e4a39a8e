#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpResponses.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace credentials::adapters::primary {

/**
 * @brief Последовательный запуск middleware и конечного handler
 *
 * Каждый элемент, пропускающий запрос дальше, оставляет статус 0.
 * Первый выставленный ненулевой статус завершает цепочку.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0)
                return;
        }

        // если в конце статус все равно = 0, то это ошибка бизнес логики
        std::cerr << "[ChainHandler] Error: middleware chain finished, but httpStatus is zero." << std::endl;
        sendError(res, 500, "Internal server error", domain::AuthErrorKind::INTERNAL_ERROR);
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace credentials::adapters::primary
