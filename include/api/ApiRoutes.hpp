#pragma once
#include "api/HttpMessage.hpp"
#include "api/RateLimiter.hpp"
#include "app/Config.hpp"
#include "control/ServoController.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * REST surface over a ServoController.
 *
 * handle() is the whole request pipeline: request/response logging, rate
 * limiting, CORS headers, routing and error mapping. It never throws.
 * The emergency-stop routes bypass the rate limiter.
 *
 *   GET  /
 *   GET  /api/status
 *   GET  /api/servos
 *   POST /api/initialize
 *   POST /api/emergency-stop
 *   POST /api/emergency-stop/clear
 *   POST /api/servos/{id}/start   {"direction": "forward"|"backward"}
 *   POST /api/servos/{id}/speed   {"speed": -1.0 .. 1.0}
 *   POST /api/servos/{id}/stop
 */
class ApiRoutes {
public:
    ApiRoutes(ServoController& controller, const AppConfig& config);

    HttpResponse handle(const HttpRequest& req);

private:
    HttpResponse route(const HttpRequest& req);
    static bool isSafetyRoute(const std::string& path);

    HttpResponse root() const;
    HttpResponse systemStatus() const;
    HttpResponse servoList() const;
    HttpResponse initialize();
    HttpResponse emergencyStop();
    HttpResponse clearEmergencyStop();
    HttpResponse startServo(const std::string& id, const HttpRequest& req);
    HttpResponse setServoSpeed(const std::string& id, const HttpRequest& req);
    HttpResponse stopServo(const std::string& id);

    std::string servoStatusJson(const ServoStatus& s) const;
    std::string servoMapJson() const;
    void applyCors(const HttpRequest& req, HttpResponse& res) const;

    ServoController& controller_;
    const SystemConfig system_;
    const CorsConfig cors_;
    std::unique_ptr<RateLimiter> limiter_;
};

HttpResponse json_response(int status, const std::string& body);
HttpResponse error_response(int status, const std::string& error, const std::string& details = {});
