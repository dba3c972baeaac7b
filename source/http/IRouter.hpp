#ifndef TODOSERVER_HTTP_IROUTER_HPP
#define TODOSERVER_HTTP_IROUTER_HPP

#include <QtHttpServer/QHttpServer>

class IRouter {
public:
    virtual ~IRouter() = default;

    virtual void registerRoutes(QHttpServer &server) = 0;
};

#endif // TODOSERVER_HTTP_IROUTER_HPP
