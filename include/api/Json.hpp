#pragma once
#include <string>

std::string json_escape(const std::string& s);

// Builds a flat JSON object left to right. Nested values go in via addRaw().
class JsonObject {
public:
    JsonObject& add(const std::string& key, const std::string& value);
    JsonObject& add(const std::string& key, const char* value);
    JsonObject& add(const std::string& key, double value);
    JsonObject& add(const std::string& key, bool value);
    JsonObject& addNull(const std::string& key);
    JsonObject& addRaw(const std::string& key, const std::string& json);

    std::string str() const { return "{" + body_ + "}"; }

private:
    void key(const std::string& k);
    std::string body_;
};

// Current UTC time as 2025-01-01T12:00:00.123456Z.
std::string iso_timestamp_utc();
