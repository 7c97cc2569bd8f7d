#include "api/ApiRoutes.hpp"
#include "FakePwmOutput.hpp"
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

namespace {

ServoDescriptor servo(const std::string& id, int pin) {
    ServoDescriptor d;
    d.id = id;
    d.name = id;
    d.pin = pin;
    return d;
}

HttpRequest request(const std::string& method, const std::string& path, const std::string& body = {}) {
    HttpRequest req;
    req.method = method;
    req.path = path;
    req.body = body;
    req.clientAddress = "127.0.0.1";
    return req;
}

std::string header(const HttpResponse& res, const std::string& name) {
    for (const auto& [k, v] : res.headers) {
        if (k == name) return v;
    }
    return {};
}

class ApiRoutesTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.hardware.servos = {servo("base", 17), servo("gripper", 27)};
        config.api.rate_limiting.enabled = false;
        controller = std::make_unique<ServoController>(config.hardware, config.safety, fake.factory());
        ASSERT_EQ(controller->initialize(), InitResult::Ok);
        routes = std::make_unique<ApiRoutes>(*controller, config);
    }

    YAML::Node call(const std::string& method, const std::string& path, const std::string& body,
                    int expectedStatus) {
        last = routes->handle(request(method, path, body));
        EXPECT_EQ(last.status, expectedStatus) << method << " " << path << " -> " << last.body;
        return last.body.empty() ? YAML::Node() : YAML::Load(last.body);
    }

    AppConfig config;
    FakeHardware fake;
    std::unique_ptr<ServoController> controller;
    std::unique_ptr<ApiRoutes> routes;
    HttpResponse last;
};

TEST_F(ApiRoutesTest, RootDescribesService) {
    auto body = call("GET", "/", "", 200);
    EXPECT_EQ(body["name"].as<std::string>(), config.system.name);
    EXPECT_EQ(body["version"].as<std::string>(), "1.0.0");
}

TEST_F(ApiRoutesTest, SetSpeedEchoesSpeed) {
    auto body = call("POST", "/api/servos/base/speed", R"({"speed": 0.5})", 200);
    EXPECT_TRUE(body["success"].as<bool>());
    EXPECT_EQ(body["servo_id"].as<std::string>(), "base");
    EXPECT_DOUBLE_EQ(body["speed"].as<double>(), 0.5);
    EXPECT_EQ(body["message"].as<std::string>(), "Set servo base speed to 0.50");
    EXPECT_TRUE(controller->status("base")->isRunning);
}

TEST_F(ApiRoutesTest, SetSpeedEchoesLimitedSpeed) {
    config.safety.global_max_speed = 80;
    routes.reset();
    controller = std::make_unique<ServoController>(config.hardware, config.safety, fake.factory());
    ASSERT_EQ(controller->initialize(), InitResult::Ok);
    routes = std::make_unique<ApiRoutes>(*controller, config);

    auto body = call("POST", "/api/servos/base/speed", R"({"speed": 1.0})", 200);
    EXPECT_DOUBLE_EQ(body["speed"].as<double>(), 0.8);
    EXPECT_EQ(body["message"].as<std::string>(), "Set servo base speed to 0.80");
    EXPECT_DOUBLE_EQ(controller->status("base")->speed, 0.8);

    body = call("POST", "/api/servos/base/speed", R"({"speed": -0.9})", 200);
    EXPECT_DOUBLE_EQ(body["speed"].as<double>(), -0.8);
}

TEST_F(ApiRoutesTest, SetSpeedOnUnknownServoIs400) {
    auto body = call("POST", "/api/servos/nonexistent/speed", R"({"speed": 0.1})", 400);
    EXPECT_FALSE(body["success"].as<bool>());
    EXPECT_EQ(body["details"].as<std::string>(), "not_found");
}

TEST_F(ApiRoutesTest, InvalidSpeedBodiesAre422) {
    call("POST", "/api/servos/base/speed", R"({"speed": 1.5})", 422);
    call("POST", "/api/servos/base/speed", R"({"velocity": 0.5})", 422);
    call("POST", "/api/servos/base/speed", R"({"speed": "fast"})", 422);
    call("POST", "/api/servos/base/speed", "{not json", 422);
    call("POST", "/api/servos/base/speed", "", 422);
    EXPECT_FALSE(controller->status("base")->isRunning);
}

TEST_F(ApiRoutesTest, StartEchoesDirection) {
    auto body = call("POST", "/api/servos/gripper/start", R"({"direction": "backward"})", 200);
    EXPECT_EQ(body["direction"].as<std::string>(), "backward");
    EXPECT_EQ(body["servo_id"].as<std::string>(), "gripper");
    EXPECT_FALSE(body["timestamp"].as<std::string>().empty());
    EXPECT_LT(controller->status("gripper")->speed, 0.0);

    call("POST", "/api/servos/gripper/start", R"({"direction": "sideways"})", 422);
    call("POST", "/api/servos/nope/start", R"({"direction": "forward"})", 400);
}

TEST_F(ApiRoutesTest, StopReportsZeroSpeed) {
    call("POST", "/api/servos/base/speed", R"({"speed": -0.3})", 200);
    auto body = call("POST", "/api/servos/base/stop", "", 200);
    EXPECT_DOUBLE_EQ(body["speed"].as<double>(), 0.0);
    EXPECT_FALSE(controller->status("base")->isRunning);
    call("POST", "/api/servos/unknown/stop", "", 400);
}

TEST_F(ApiRoutesTest, EmergencyStopBlocksUntilCleared) {
    call("POST", "/api/servos/base/speed", R"({"speed": 0.7})", 200);

    auto body = call("POST", "/api/emergency-stop", "", 200);
    EXPECT_EQ(body["servo_id"].as<std::string>(), "all");
    EXPECT_DOUBLE_EQ(body["speed"].as<double>(), 0.0);

    auto status = call("GET", "/api/status", "", 200);
    EXPECT_TRUE(status["emergency_stop_active"].as<bool>());
    EXPECT_FALSE(status["servos"]["base"]["is_running"].as<bool>());

    body = call("POST", "/api/servos/base/speed", R"({"speed": 0.3})", 400);
    EXPECT_EQ(body["details"].as<std::string>(), "emergency_stop_active");

    call("POST", "/api/emergency-stop/clear", "", 200);
    call("POST", "/api/servos/base/speed", R"({"speed": 0.3})", 200);
}

TEST_F(ApiRoutesTest, EmergencyStopFailureIs500) {
    call("POST", "/api/servos/base/speed", R"({"speed": 0.7})", 200);
    fake.lines.at("base")->failWrites = true;
    auto body = call("POST", "/api/emergency-stop", "", 500);
    EXPECT_FALSE(body["success"].as<bool>());
}

TEST_F(ApiRoutesTest, StatusListsEveryServo) {
    call("POST", "/api/servos/base/speed", R"({"speed": 0.25})", 200);
    auto body = call("GET", "/api/status", "", 200);

    EXPECT_EQ(body["system_status"].as<std::string>(), "running");
    EXPECT_FALSE(body["emergency_stop_active"].as<bool>());
    ASSERT_TRUE(body["servos"].IsMap());
    EXPECT_EQ(body["servos"].size(), 2u);

    auto base = body["servos"]["base"];
    EXPECT_EQ(base["status"].as<std::string>(), "running");
    EXPECT_EQ(base["direction"].as<std::string>(), "forward");
    EXPECT_DOUBLE_EQ(base["speed"].as<double>(), 0.25);
    EXPECT_TRUE(base["is_running"].as<bool>());
    EXPECT_GE(base["runtime"].as<double>(), 0.0);

    auto gripper = body["servos"]["gripper"];
    EXPECT_EQ(gripper["status"].as<std::string>(), "stopped");
    EXPECT_TRUE(gripper["direction"].IsNull());
}

TEST_F(ApiRoutesTest, ServoListIsPlainMapping) {
    auto body = call("GET", "/api/servos", "", 200);
    ASSERT_TRUE(body.IsMap());
    EXPECT_TRUE(body["base"].IsMap());
    EXPECT_TRUE(body["gripper"].IsMap());
}

TEST_F(ApiRoutesTest, InitializeReportsFailureAs500) {
    call("POST", "/api/initialize", "", 200);

    fake.failConstruction.insert("gripper");
    auto body = call("POST", "/api/initialize", "", 500);
    EXPECT_EQ(body["details"].as<std::string>(), "hardware_fault");
    EXPECT_EQ(controller->servoCount(), 0u);
}

TEST_F(ApiRoutesTest, UnknownRoutesAndMethods) {
    call("GET", "/api/nothing", "", 404);
    call("GET", "/other", "", 404);
    call("GET", "/api/servos/base/speed", "", 405);
    call("POST", "/api/status", "", 405);
    call("POST", "/api/servos/base/spin", "", 404);
}

TEST_F(ApiRoutesTest, CorsAndTimingHeaders) {
    call("GET", "/api/status", "", 200);
    EXPECT_EQ(header(last, "Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(header(last, "Access-Control-Allow-Methods"), "GET, POST, PUT, DELETE");
    EXPECT_FALSE(header(last, "X-Process-Time").empty());

    call("OPTIONS", "/api/servos/base/speed", "", 204);
}

TEST_F(ApiRoutesTest, CorsDisabledSendsNoHeaders) {
    config.api.cors.enabled = false;
    routes = std::make_unique<ApiRoutes>(*controller, config);
    call("GET", "/api/status", "", 200);
    EXPECT_TRUE(header(last, "Access-Control-Allow-Origin").empty());
}

TEST_F(ApiRoutesTest, RateLimitReturns429) {
    config.api.rate_limiting.enabled = true;
    config.api.rate_limiting.requests_per_minute = 1;
    config.api.rate_limiting.burst_limit = 2;
    routes = std::make_unique<ApiRoutes>(*controller, config);

    call("GET", "/api/status", "", 200);
    call("GET", "/api/status", "", 200);
    auto body = call("GET", "/api/status", "", 429);
    EXPECT_FALSE(body["success"].as<bool>());
}

TEST_F(ApiRoutesTest, EmergencyStopIsNeverRateLimited) {
    config.api.rate_limiting.enabled = true;
    config.api.rate_limiting.requests_per_minute = 1;
    config.api.rate_limiting.burst_limit = 2;
    routes = std::make_unique<ApiRoutes>(*controller, config);

    call("POST", "/api/servos/base/speed", R"({"speed": 0.6})", 200);
    call("GET", "/api/status", "", 200);
    call("GET", "/api/status", "", 429);

    auto body = call("POST", "/api/emergency-stop", "", 200);
    EXPECT_TRUE(body["success"].as<bool>());
    EXPECT_FALSE(controller->status("base")->isRunning);
    EXPECT_TRUE(controller->isEmergencyStopActive());

    call("POST", "/api/emergency-stop", "", 200);
    call("POST", "/api/emergency-stop/clear", "", 200);
    EXPECT_FALSE(controller->isEmergencyStopActive());

    // the bucket is still empty for everything else
    call("GET", "/api/status", "", 429);
}

}  // namespace
