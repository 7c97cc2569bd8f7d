#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string method;
    std::string path;                             // without query string
    std::string query;
    std::map<std::string, std::string> headers;   // names lower-cased
    std::string body;
    std::string clientAddress;

    std::string header(const std::string& lowerName) const;
};

struct HttpResponse {
    int status = 200;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    void setHeader(const std::string& name, const std::string& value);
};

enum class ParseStatus { Complete, Incomplete, Invalid };

constexpr std::size_t kMaxRequestBytes = 64 * 1024;

// Parses one HTTP/1.x request from the bytes received so far.
ParseStatus parse_http_request(const std::string& raw, HttpRequest& out);

std::string serialize_response(const HttpResponse& res);
const char* status_reason(int status);
