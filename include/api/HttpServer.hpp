#pragma once
#include "api/HttpMessage.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

/**
 * Minimal HTTP/1.1 server on a blocking POSIX socket.
 *
 * One thread accepts connections and queues them; `workers` threads pull
 * connections off the queue, read one request, call the handler and close.
 * Handler calls may therefore run concurrently.
 */
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpServer(std::string host, int port, int workers, Handler handler);
    ~HttpServer();

    // Binds and starts the threads. Throws std::runtime_error if the socket
    // cannot be bound.
    void start();
    void stop();

    int port() const { return port_; }

    // Total time a client gets to deliver one request. Default 5s.
    void setRequestTimeout(std::chrono::milliseconds timeout) { requestTimeout_ = timeout; }

private:
    struct Client {
        int fd;
        std::string address;
    };

    void acceptLoop();
    void workerLoop();
    void serveClient(const Client& client);
    bool readRequest(int fd, HttpRequest& req, int& errorStatus);
    void writeAll(int fd, const std::string& data);
    void closeServer();

    std::string host_;
    int port_;
    int workerCount_;
    Handler handler_;
    std::chrono::milliseconds requestTimeout_{5000};

    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::thread acceptThread_;
    std::vector<std::thread> workers_;

    std::mutex q_mtx_;
    std::condition_variable q_cv_;
    std::queue<Client> queue_;
};
