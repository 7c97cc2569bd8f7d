#include "api/HttpServer.hpp"
#include "app/Log.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

HttpServer::HttpServer(std::string host, int port, int workers, Handler handler)
    : host_(std::move(host)), port_(port), workerCount_(workers), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) return;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("[http] Invalid bind address " + host_);
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error(std::string("[http] Socket creation failed: ") + std::strerror(errno));
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        const std::string err = std::strerror(errno);
        closeServer();
        throw std::runtime_error("[http] Bind to " + host_ + ":" + std::to_string(port_) + " failed: " + err);
    }
    if (listen(server_fd_, 16) < 0) {
        const std::string err = std::strerror(errno);
        closeServer();
        throw std::runtime_error("[http] Listen failed: " + err);
    }

    if (port_ == 0) {
        socklen_t len = sizeof(addr);
        if (getsockname(server_fd_, (struct sockaddr*)&addr, &len) == 0) {
            port_ = ntohs(addr.sin_port);
        }
    }

    stop_requested_ = false;
    running_ = true;
    for (int i = 0; i < workerCount_; ++i) {
        workers_.emplace_back(&HttpServer::workerLoop, this);
    }
    acceptThread_ = std::thread(&HttpServer::acceptLoop, this);

    logInfo("http") << "Listening on " << host_ << ":" << port_ << " with " << workerCount_ << " workers";
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    {
        // under the queue lock so a worker between its predicate check and
        // its wait cannot miss the notify below
        std::lock_guard<std::mutex> lk(q_mtx_);
        stop_requested_ = true;
    }

    // unblocks accept()
    if (server_fd_ != -1) shutdown(server_fd_, SHUT_RDWR);
    if (acceptThread_.joinable()) acceptThread_.join();
    closeServer();

    q_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();

    std::lock_guard<std::mutex> lk(q_mtx_);
    while (!queue_.empty()) {
        close(queue_.front().fd);
        queue_.pop();
    }
    logInfo("http") << "Stopped";
}

void HttpServer::acceptLoop() {
    while (!stop_requested_) {
        sockaddr_in clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);
        int fd = accept(server_fd_, (struct sockaddr*)&clientAddr, &addrLen);
        if (fd < 0) {
            if (stop_requested_) break;
            if (errno == EINTR) continue;
            logWarn("http") << "Accept failed: " << std::strerror(errno);
            continue;
        }

        char ip[INET_ADDRSTRLEN] = "unknown";
        inet_ntop(AF_INET, &clientAddr.sin_addr, ip, sizeof(ip));
        {
            std::lock_guard<std::mutex> lk(q_mtx_);
            queue_.push(Client{fd, ip});
        }
        q_cv_.notify_one();
    }
}

void HttpServer::workerLoop() {
    while (true) {
        std::unique_lock<std::mutex> lk(q_mtx_);
        q_cv_.wait(lk, [&] { return !queue_.empty() || stop_requested_; });
        if (stop_requested_) break;
        Client client = queue_.front();
        queue_.pop();
        lk.unlock();

        serveClient(client);
        close(client.fd);
    }
}

void HttpServer::serveClient(const Client& client) {
    HttpRequest req;
    int errorStatus = 0;
    HttpResponse res;
    if (!readRequest(client.fd, req, errorStatus)) {
        if (errorStatus == 0) return;  // peer went away
        res.status = errorStatus;
        res.body = std::string("{\"success\":false,\"error\":\"") + status_reason(errorStatus) + "\"}";
    } else {
        req.clientAddress = client.address;
        try {
            res = handler_(req);
        } catch (const std::exception& e) {
            logError("http") << "Handler failed for " << req.method << " " << req.path << ": " << e.what();
            res = HttpResponse{};
            res.status = 500;
            res.body = "{\"success\":false,\"error\":\"Internal server error\"}";
        }
    }

    try {
        writeAll(client.fd, serialize_response(res));
    } catch (const std::exception& e) {
        logWarn("http") << "Failed to send response to " << client.address << ": " << e.what();
    }
}

// The whole request must arrive within requestTimeout_, however it is split
// across packets.
bool HttpServer::readRequest(int fd, HttpRequest& req, int& errorStatus) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + requestTimeout_;
    std::string raw;
    char buffer[4096];
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - clock::now());
        if (left.count() <= 0) {
            errorStatus = raw.empty() ? 0 : 408;
            return false;
        }
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(left.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(left.count() % 1000000);
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        ssize_t bytes = recv(fd, buffer, sizeof(buffer), 0);
        if (bytes < 0 && errno == EINTR) continue;
        if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            errorStatus = raw.empty() ? 0 : 408;
            return false;
        }
        if (bytes <= 0) {
            errorStatus = raw.empty() ? 0 : 400;
            return false;
        }
        raw.append(buffer, static_cast<std::size_t>(bytes));

        switch (parse_http_request(raw, req)) {
            case ParseStatus::Complete:
                return true;
            case ParseStatus::Invalid:
                errorStatus = raw.size() > kMaxRequestBytes ? 413 : 400;
                return false;
            case ParseStatus::Incomplete:
                if (raw.size() > 2 * kMaxRequestBytes) {
                    errorStatus = 413;
                    return false;
                }
                break;
        }
    }
}

void HttpServer::writeAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::strerror(errno));
        }
        sent += static_cast<std::size_t>(n);
    }
}

void HttpServer::closeServer() {
    if (server_fd_ != -1) {
        close(server_fd_);
        server_fd_ = -1;
    }
}
