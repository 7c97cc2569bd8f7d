#pragma once
#include "api/ApiRoutes.hpp"
#include "api/HttpServer.hpp"
#include "app/Config.hpp"
#include "control/ServoController.hpp"
#include <atomic>
#include <memory>
#include <string>

class App {
public:
    explicit App(std::string configPath);
    ~App();

    // lifecycle
    void init();   // load config, open servo outputs; throws on bad config
    void start();  // bind the HTTP server
    void stop();   // stop serving, halt and release every servo

private:
    std::string configPath_;
    AppConfig config_;

    std::atomic<bool> running_{false};

    // construction order matters: routes and server hold a reference to the controller
    std::unique_ptr<ServoController> servos_;
    std::unique_ptr<ApiRoutes> routes_;
    std::unique_ptr<HttpServer> server_;
};
