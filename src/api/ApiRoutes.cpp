#include "api/ApiRoutes.hpp"
#include "api/Json.hpp"
#include "app/Log.hpp"
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

// Request bodies are JSON; JSON flow syntax is valid YAML, so yaml-cpp parses them.
YAML::Node parse_body(const HttpRequest& req) {
    YAML::Node node = YAML::Load(req.body);
    if (!node.IsMap()) {
        throw std::runtime_error("Request body must be a JSON object");
    }
    return node;
}

std::string speed_text(double speed) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << speed;
    return ss.str();
}

}  // namespace

HttpResponse json_response(int status, const std::string& body) {
    HttpResponse res;
    res.status = status;
    res.body = body;
    res.setHeader("Content-Type", "application/json");
    return res;
}

HttpResponse error_response(int status, const std::string& error, const std::string& details) {
    JsonObject o;
    o.add("success", false).add("error", error);
    if (details.empty()) {
        o.addNull("details");
    } else {
        o.add("details", details);
    }
    return json_response(status, o.str());
}

ApiRoutes::ApiRoutes(ServoController& controller, const AppConfig& config)
    : controller_(controller), system_(config.system), cors_(config.api.cors) {
    if (config.api.rate_limiting.enabled) {
        limiter_ = std::make_unique<RateLimiter>(config.api.rate_limiting.requests_per_minute,
                                                 config.api.rate_limiting.burst_limit);
    }
}

HttpResponse ApiRoutes::handle(const HttpRequest& req) {
    const auto begin = std::chrono::steady_clock::now();
    logInfo("http") << "Request: " << req.method << " " << req.path << " Client: "
                    << (req.clientAddress.empty() ? "Unknown" : req.clientAddress);

    HttpResponse res;
    try {
        if (limiter_ && req.method != "OPTIONS" && !isSafetyRoute(req.path) &&
            !limiter_->allow(req.clientAddress)) {
            res = error_response(429, "Rate limit exceeded");
        } else {
            res = route(req);
        }
    } catch (const std::exception& e) {
        logError("http") << "Error processing request: " << e.what();
        res = error_response(500, "Internal server error", e.what());
    }

    applyCors(req, res);
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", took);
    res.setHeader("X-Process-Time", buf);

    logInfo("http") << "Response: " << res.status << " Process Time: " << std::fixed
                    << std::setprecision(3) << took << "s";
    return res;
}

// Emergency stop and its release are never throttled.
bool ApiRoutes::isSafetyRoute(const std::string& path) {
    const auto parts = split_path(path);
    if (parts.size() < 2 || parts.size() > 3) return false;
    if (parts[0] != "api" || parts[1] != "emergency-stop") return false;
    return parts.size() == 2 || parts[2] == "clear";
}

HttpResponse ApiRoutes::route(const HttpRequest& req) {
    const auto parts = split_path(req.path);
    const std::string& m = req.method;

    if (m == "OPTIONS") {
        HttpResponse res;
        res.status = cors_.enabled ? 204 : 405;
        return res;
    }

    if (parts.empty()) {
        return m == "GET" ? root() : error_response(405, "Method not allowed");
    }
    if (parts[0] != "api") return error_response(404, "Not found");

    if (parts.size() == 2 && parts[1] == "status") {
        return m == "GET" ? systemStatus() : error_response(405, "Method not allowed");
    }
    if (parts.size() == 2 && parts[1] == "servos") {
        return m == "GET" ? servoList() : error_response(405, "Method not allowed");
    }
    if (parts.size() == 2 && parts[1] == "initialize") {
        return m == "POST" ? initialize() : error_response(405, "Method not allowed");
    }
    if (parts.size() == 2 && parts[1] == "emergency-stop") {
        return m == "POST" ? emergencyStop() : error_response(405, "Method not allowed");
    }
    if (parts.size() == 3 && parts[1] == "emergency-stop" && parts[2] == "clear") {
        return m == "POST" ? clearEmergencyStop() : error_response(405, "Method not allowed");
    }
    if (parts.size() == 4 && parts[1] == "servos") {
        const std::string& id = parts[2];
        const std::string& action = parts[3];
        if (action != "start" && action != "speed" && action != "stop") {
            return error_response(404, "Not found");
        }
        if (m != "POST") return error_response(405, "Method not allowed");
        if (action == "start") return startServo(id, req);
        if (action == "speed") return setServoSpeed(id, req);
        return stopServo(id);
    }
    return error_response(404, "Not found");
}

HttpResponse ApiRoutes::root() const {
    JsonObject o;
    o.add("name", system_.name)
     .add("version", system_.version)
     .add("description", "REST API for controlling a robotic arm");
    return json_response(200, o.str());
}

std::string ApiRoutes::servoStatusJson(const ServoStatus& s) const {
    JsonObject o;
    o.add("status", s.isRunning ? "running" : "stopped");
    if (s.direction) {
        o.add("direction", to_string(*s.direction));
    } else {
        o.addNull("direction");
    }
    o.add("runtime", s.runtimeSec)
     .add("speed", s.speed)
     .add("is_running", s.isRunning);
    return o.str();
}

std::string ApiRoutes::servoMapJson() const {
    JsonObject servos;
    for (const auto& [id, status] : controller_.statusAll()) {
        servos.addRaw(id, servoStatusJson(status));
    }
    return servos.str();
}

HttpResponse ApiRoutes::systemStatus() const {
    const bool estop = controller_.isEmergencyStopActive();
    JsonObject o;
    o.add("system_status", estop ? "emergency_stop" : "running")
     .add("emergency_stop_active", estop)
     .addRaw("servos", servoMapJson())
     .add("timestamp", iso_timestamp_utc());
    return json_response(200, o.str());
}

HttpResponse ApiRoutes::servoList() const {
    return json_response(200, servoMapJson());
}

HttpResponse ApiRoutes::initialize() {
    const InitResult r = controller_.initialize();
    if (r != InitResult::Ok) {
        const std::string msg = r == InitResult::NoServosConfigured
                                    ? "Failed to initialize servos: no servos configured"
                                    : "Failed to initialize servos";
        return error_response(500, msg, to_string(r));
    }
    JsonObject o;
    o.add("success", true).add("servo_id", "all").add("speed", 0.0).add("message", "All servos initialized");
    return json_response(200, o.str());
}

HttpResponse ApiRoutes::emergencyStop() {
    if (!controller_.emergencyStop()) {
        return error_response(500, "Failed to execute emergency stop");
    }
    JsonObject o;
    o.add("success", true).add("servo_id", "all").add("speed", 0.0).add("message", "Emergency stop activated");
    return json_response(200, o.str());
}

HttpResponse ApiRoutes::clearEmergencyStop() {
    controller_.clearEmergencyStop();
    JsonObject o;
    o.add("success", true).add("servo_id", "all").add("speed", 0.0).add("message", "Emergency stop cleared");
    return json_response(200, o.str());
}

HttpResponse ApiRoutes::startServo(const std::string& id, const HttpRequest& req) {
    std::optional<Direction> direction;
    try {
        auto body = parse_body(req);
        if (auto v = body["direction"]; v && v.IsScalar()) {
            direction = parse_direction(v.as<std::string>());
        }
    } catch (const std::exception& e) {
        return error_response(422, "Invalid request body", e.what());
    }
    if (!direction) {
        return error_response(422, "Invalid request body", "direction must be 'forward' or 'backward'");
    }

    ServoFault fault = ServoFault::None;
    if (!controller_.start(id, *direction, &fault)) {
        return error_response(400, "Failed to start servo " + id, to_string(fault));
    }
    JsonObject o;
    o.add("success", true)
     .add("servo_id", id)
     .addNull("message")
     .add("timestamp", iso_timestamp_utc())
     .add("direction", to_string(*direction));
    return json_response(200, o.str());
}

HttpResponse ApiRoutes::setServoSpeed(const std::string& id, const HttpRequest& req) {
    double speed = 0.0;
    try {
        auto body = parse_body(req);
        auto v = body["speed"];
        if (!v || !v.IsScalar()) {
            return error_response(422, "Invalid request body", "speed is required");
        }
        speed = v.as<double>();
    } catch (const std::exception& e) {
        return error_response(422, "Invalid request body", e.what());
    }
    if (!(speed >= -1.0 && speed <= 1.0)) {
        return error_response(422, "Invalid request body", "speed must be between -1.0 and 1.0");
    }

    ServoFault fault = ServoFault::None;
    double applied = speed;
    if (!controller_.setSpeed(id, speed, &fault, &applied)) {
        return error_response(400, "Failed to set speed for servo " + id, to_string(fault));
    }
    JsonObject o;
    o.add("success", true)
     .add("servo_id", id)
     .add("speed", applied)
     .add("message", "Set servo " + id + " speed to " + speed_text(applied));
    return json_response(200, o.str());
}

HttpResponse ApiRoutes::stopServo(const std::string& id) {
    ServoFault fault = ServoFault::None;
    if (!controller_.stop(id, &fault)) {
        return error_response(400, "Failed to stop servo " + id, to_string(fault));
    }
    JsonObject o;
    o.add("success", true)
     .add("servo_id", id)
     .add("speed", 0.0)
     .add("message", "Stopped servo " + id);
    return json_response(200, o.str());
}

void ApiRoutes::applyCors(const HttpRequest& req, HttpResponse& res) const {
    if (!cors_.enabled) return;

    const std::string origin = req.header("origin");
    bool wildcard = false;
    bool listed = false;
    for (const auto& o : cors_.allowed_origins) {
        if (o == "*") wildcard = true;
        if (!origin.empty() && o == origin) listed = true;
    }
    if (wildcard) {
        res.setHeader("Access-Control-Allow-Origin", "*");
    } else if (listed) {
        res.setHeader("Access-Control-Allow-Origin", origin);
        res.setHeader("Vary", "Origin");
    } else {
        return;
    }
    res.setHeader("Access-Control-Allow-Methods", join(cors_.allowed_methods));
    res.setHeader("Access-Control-Allow-Headers", join(cors_.allowed_headers));
}
