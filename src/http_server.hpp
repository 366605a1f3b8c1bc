#pragma once
#include <string>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include "control.hpp"

// Minimal HTTP/1.1 front for the control endpoints. One thread accepts,
// each connection is served on a detached thread and closed after the reply.
// stop() returns only after every connection thread has finished; reads and
// writes on a connection give up after io_timeout_ms.
class HttpServer {
public:
    HttpServer(const std::string &bind_addr,
               uint16_t port,
               Control &control,
               const std::string &auth_expected = "",
               int io_timeout_ms = 5000);
    ~HttpServer();

    bool start();
    void stop();

    // Bound port; the kernel's choice after start() when constructed with 0.
    uint16_t port() const { return port_; }
    size_t active_connections() const;

private:
    void accept_loop();
    void handle_connection(int sock_fd);
    void connection_done();

    std::string bind_addr_;
    uint16_t port_;
    Control &control_;
    std::string auth_expected_header_;
    int io_timeout_ms_;

    int listen_sock_;
    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::mutex lifecycle_mu_;

    mutable std::mutex conn_mu_;
    std::condition_variable conn_cv_;
    size_t active_conns_;
};
