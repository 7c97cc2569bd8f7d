#include "app/App.hpp"
#include "app/Log.hpp"
#include "hardware/PwmOutput.hpp"
#include <utility>

App::App(std::string configPath) : configPath_(std::move(configPath)) {}

App::~App() {
    stop();
}

void App::init() {
    config_ = load_config_from_file(configPath_);
    configure_logging(config_.logging);
    logInfo("app") << "Configuration loaded successfully from " << configPath_;

    if (config_.api.authentication.enabled) {
        logWarn("app") << "api.authentication is enabled in config but not enforced";
    }

    servos_ = std::make_unique<ServoController>(config_.hardware, config_.safety,
                                                make_pwm_output_factory(config_.hardware));

    // A failed initialize is not fatal: POST /api/initialize can retry once the
    // hardware is fixed.
    const InitResult r = servos_->initialize();
    if (r != InitResult::Ok) {
        logError("app") << "Servo initialization failed: " << to_string(r);
    }

    routes_ = std::make_unique<ApiRoutes>(*servos_, config_);
    ApiRoutes* routes = routes_.get();
    server_ = std::make_unique<HttpServer>(config_.api.host, config_.api.port, config_.api.workers,
                                           [routes](const HttpRequest& req) { return routes->handle(req); });
}

void App::start() {
    if (running_.exchange(true)) return;
    server_->start();
    logInfo("app") << "Started.";
}

void App::stop() {
    if (!running_.exchange(false)) return;
    if (server_) server_->stop();
    if (servos_) servos_->cleanup();
    logInfo("app") << "Stopped.";
}
