#include "api/HttpMessage.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::string HttpRequest::header(const std::string& lowerName) const {
    auto it = headers.find(lowerName);
    return it == headers.end() ? std::string{} : it->second;
}

void HttpResponse::setHeader(const std::string& name, const std::string& value) {
    for (auto& h : headers) {
        if (to_lower(h.first) == to_lower(name)) {
            h.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

ParseStatus parse_http_request(const std::string& raw, HttpRequest& out) {
    const auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return raw.size() > kMaxRequestBytes ? ParseStatus::Invalid : ParseStatus::Incomplete;
    }

    std::istringstream head(raw.substr(0, headerEnd));
    std::string line;
    if (!std::getline(head, line)) return ParseStatus::Invalid;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream requestLine(line);
    std::string target, version;
    if (!(requestLine >> out.method >> target >> version)) return ParseStatus::Invalid;
    if (version.rfind("HTTP/1.", 0) != 0 || target.empty() || target[0] != '/') {
        return ParseStatus::Invalid;
    }
    const auto q = target.find('?');
    out.path = target.substr(0, q);
    out.query = q == std::string::npos ? std::string{} : target.substr(q + 1);

    out.headers.clear();
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        const auto colon = line.find(':');
        if (colon == std::string::npos) return ParseStatus::Invalid;
        out.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    std::size_t contentLength = 0;
    if (auto it = out.headers.find("content-length"); it != out.headers.end()) {
        const auto& v = it->second;
        if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return ParseStatus::Invalid;
        }
        try {
            contentLength = std::stoul(v);
        } catch (const std::exception&) {
            return ParseStatus::Invalid;
        }
        if (contentLength > kMaxRequestBytes) return ParseStatus::Invalid;
    }

    const auto bodyStart = headerEnd + 4;
    if (raw.size() < bodyStart + contentLength) return ParseStatus::Incomplete;
    out.body = raw.substr(bodyStart, contentLength);
    return ParseStatus::Complete;
}

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string serialize_response(const HttpResponse& res) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << res.status << " " << status_reason(res.status) << "\r\n";
    bool hasType = false;
    for (const auto& [name, value] : res.headers) {
        if (to_lower(name) == "content-type") hasType = true;
        ss << name << ": " << value << "\r\n";
    }
    if (!hasType && !res.body.empty()) ss << "Content-Type: application/json\r\n";
    ss << "Content-Length: " << res.body.size() << "\r\n";
    ss << "Connection: close\r\n\r\n";
    ss << res.body;
    return ss.str();
}
