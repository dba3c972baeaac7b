#ifndef TODOSERVER_HTTP_TODOROUTER_HPP
#define TODOSERVER_HTTP_TODOROUTER_HPP

#include "IRouter.hpp"
#include "ITaskService.hpp"
#include <memory>

class TodoRouter : public IRouter {
public:
    explicit TodoRouter(std::shared_ptr<ITaskService> service);

    void registerRoutes(QHttpServer &server) override;

private:
    std::shared_ptr<ITaskService> m_service;
};

#endif // TODOSERVER_HTTP_TODOROUTER_HPP
