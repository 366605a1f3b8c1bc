// src/http_server.cpp
// Control API over plain sockets. GET and POST with a Content-Length body,
// optional Basic Auth.
//
// Portable: uses winsock2 on Windows and BSD sockets on POSIX.

#include "http_server.hpp"
#include "util_log.hpp"

#include <sstream>
#include <chrono>
#include <cctype>
#include <cstring>
#include <cstdlib>
#include <system_error>

#if defined(_WIN32)
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #define WIN32_LEAN_AND_MEAN
  #include <winsock2.h>
  #include <ws2tcpip.h>
  using socklen_t = int;
  static const int INVALID_SOCKET_FD = INVALID_SOCKET;
  #define HEADER_EQ(a,b) (_stricmp((a),(b))==0)
  #define SEND_FLAGS 0
#else
  #include <unistd.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <netdb.h>
  #include <arpa/inet.h>
  #include <strings.h>
  #include <sys/time.h>
  #define closesocket close
  static const int INVALID_SOCKET_FD = -1;
  #define HEADER_EQ(a,b) (strcasecmp((a),(b))==0)
  #define SEND_FLAGS MSG_NOSIGNAL
#endif

static constexpr size_t MAX_HEADER_BYTES = 64 * 1024;
static constexpr size_t MAX_BODY_BYTES = 1024 * 1024;

static const char *status_text(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

static std::string http_response(int code, const std::string &body, const std::string &ct="text/plain; charset=utf-8") {
    std::ostringstream os;
    os << "HTTP/1.1 " << code << " " << status_text(code) << "\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "Content-Type: " << ct << "\r\n"
       << "Connection: close\r\n"
       << "\r\n"
       << body;
    return os.str();
}

static std::string http_401() {
    std::string body = "401 Unauthorized";
    std::ostringstream os;
    os << "HTTP/1.1 401 Unauthorized\r\n"
       << "Content-Length: " << body.size() << "\r\n"
       << "WWW-Authenticate: Basic realm=\"querypulse\"\r\n"
       << "Connection: close\r\n"
       << "Content-Type: text/plain\r\n"
       << "\r\n"
       << body;
    return os.str();
}

static void send_all(int sock, const std::string &data) {
    size_t off = 0;
    while (off < data.size()) {
        int w = static_cast<int>(send(sock, data.c_str() + off, static_cast<int>(data.size() - off), SEND_FLAGS));
        if (w <= 0) return;
        off += static_cast<size_t>(w);
    }
}

static void set_io_timeout(int sock, int ms) {
#if defined(_WIN32)
    DWORD tv = static_cast<DWORD>(ms);
#else
    timeval tv;
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
#endif
    if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv)) != 0
        || setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof(tv)) != 0) {
        safe_log_error("HttpServer: failed to set connection timeout");
    }
}

// ---------- HttpServer implementation ----------

HttpServer::HttpServer(const std::string &bind_addr,
                       uint16_t port,
                       Control &control,
                       const std::string &auth_expected,
                       int io_timeout_ms)
    : bind_addr_(bind_addr),
      port_(port),
      control_(control),
      auth_expected_header_(auth_expected),
      io_timeout_ms_(io_timeout_ms > 0 ? io_timeout_ms : 5000),
      listen_sock_(INVALID_SOCKET_FD),
      running_(false),
      active_conns_(0)
{
#if defined(_WIN32)
    WSADATA wsa;
    if (WSAStartup(MAKEWORD(2,2), &wsa) != 0) {
        safe_log_error("HttpServer: WSAStartup failed");
    }
#endif
}

HttpServer::~HttpServer() {
    stop();
#if defined(_WIN32)
    WSACleanup();
#endif
}

bool HttpServer::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_) return true;

    listen_sock_ = static_cast<int>(socket(AF_INET, SOCK_STREAM, 0));
    if (listen_sock_ == INVALID_SOCKET_FD) {
        safe_log_error("HttpServer: socket() failed");
        return false;
    }

    int opt = 1;
    setsockopt(listen_sock_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<char*>(&opt), sizeof(opt));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    addr.sin_addr.s_addr = (bind_addr_.empty() ? INADDR_ANY : inet_addr(bind_addr_.c_str()));

    if (bind(listen_sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        safe_log_error("HttpServer: bind() failed on port " + std::to_string(port_));
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
        return false;
    }

    sockaddr_in bound;
    socklen_t blen = sizeof(bound);
    if (getsockname(listen_sock_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    if (listen(listen_sock_, 16) < 0) {
        safe_log_error("HttpServer: listen() failed");
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
        return false;
    }

    running_ = true;
    worker_thread_ = std::thread([this]{ this->accept_loop(); });

    safe_log(std::string("HttpServer started on port ") + std::to_string(port_));
    return true;
}

void HttpServer::stop() {
    {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        if (!running_) return;
        running_ = false;
    }

    if (listen_sock_ != INVALID_SOCKET_FD) {
#if !defined(_WIN32)
        shutdown(listen_sock_, SHUT_RDWR);
#endif
        closesocket(listen_sock_);
        listen_sock_ = INVALID_SOCKET_FD;
    }

    if (worker_thread_.joinable()) worker_thread_.join();

    // handlers use control_ and this object; wait them out
    {
        std::unique_lock<std::mutex> lk(conn_mu_);
        conn_cv_.wait(lk, [this]{ return active_conns_ == 0; });
    }

    safe_log("HttpServer stopped");
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lk(conn_mu_);
    return active_conns_;
}

void HttpServer::connection_done() {
    // notify under the lock: stop() may destroy the server as soon as it sees zero
    std::lock_guard<std::mutex> lk(conn_mu_);
    --active_conns_;
    conn_cv_.notify_all();
}

void HttpServer::accept_loop() {
    while (running_) {
        sockaddr_in client;
        socklen_t clen = sizeof(client);
        int cli_sock = static_cast<int>(accept(listen_sock_, reinterpret_cast<sockaddr*>(&client), &clen));
        if (!running_) {
            if (cli_sock != INVALID_SOCKET_FD) closesocket(cli_sock);
            break;
        }
        if (cli_sock == INVALID_SOCKET_FD) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        set_io_timeout(cli_sock, io_timeout_ms_);
        {
            std::lock_guard<std::mutex> lk(conn_mu_);
            ++active_conns_;
        }
        try {
            std::thread([this, cli_sock]{
                try {
                    handle_connection(cli_sock);
                } catch (const std::exception &e) {
                    safe_log_error(std::string("HttpServer: connection failed: ") + e.what());
                }
                connection_done();
            }).detach();
        } catch (const std::system_error &e) {
            safe_log_error(std::string("HttpServer: cannot start connection thread: ") + e.what());
            closesocket(cli_sock);
            connection_done();
        }
    }
}

// Reads headers up to "\r\n\r\n", then Content-Length bytes of body.
// Returns the HTTP status to fail with, or 0 on success.
static int recv_request(int sock, std::string &head, std::string &body) {
    head.clear();
    body.clear();
    std::string raw;
    char buf[4096];
    size_t hdr_end = std::string::npos;
    while (hdr_end == std::string::npos) {
        int r = static_cast<int>(recv(sock, buf, sizeof(buf), 0));
        if (r <= 0) return 400;
        raw.append(buf, buf + r);
        hdr_end = raw.find("\r\n\r\n");
        if (hdr_end == std::string::npos && raw.size() > MAX_HEADER_BYTES) return 413;
    }
    head = raw.substr(0, hdr_end + 2);
    body = raw.substr(hdr_end + 4);

    size_t content_length = 0;
    std::istringstream hs(head);
    std::string line;
    while (std::getline(hs, line)) {
        size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string hn = line.substr(0, c);
        if (!HEADER_EQ(hn.c_str(), "Content-Length")) continue;
        std::string hv = line.substr(c + 1);
        size_t p = 0; while (p < hv.size() && std::isspace((unsigned char)hv[p])) ++p;
        hv = hv.substr(p);
        if (!hv.empty() && hv.back() == '\r') hv.pop_back();
        if (hv.empty() || hv.find_first_not_of("0123456789") != std::string::npos || hv.size() > 9) return 400;
        content_length = static_cast<size_t>(std::strtoul(hv.c_str(), nullptr, 10));
    }
    if (content_length > MAX_BODY_BYTES) return 413;

    while (body.size() < content_length) {
        int r = static_cast<int>(recv(sock, buf, sizeof(buf), 0));
        if (r <= 0) return 400;
        body.append(buf, buf + r);
    }
    body.resize(content_length);
    return 0;
}

void HttpServer::handle_connection(int sock_fd) {
    std::string head, body;
    int rc = recv_request(sock_fd, head, body);
    if (rc != 0) {
        send_all(sock_fd, http_response(rc, std::string(status_text(rc)) + "\n"));
        closesocket(sock_fd);
        return;
    }

    std::istringstream rs(head);
    std::string method, fullpath, proto;
    rs >> method >> fullpath >> proto;

    // parse headers (only Authorization needed here)
    std::string line;
    std::string auth_hdr;
    std::getline(rs, line); // finish request line remainder
    while (std::getline(rs, line)) {
        if (line == "\r" || line.empty()) break;
        size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string hn = line.substr(0, c);
            std::string hv = line.substr(c+1);
            size_t p = 0; while (p < hv.size() && std::isspace((unsigned char)hv[p])) ++p;
            hv = hv.substr(p);
            if (!hv.empty() && hv.back() == '\r') hv.pop_back();
            if (HEADER_EQ(hn.c_str(), "Authorization")) auth_hdr = hv;
        }
    }

    if (!auth_expected_header_.empty()) {
        if (auth_hdr.empty() || auth_hdr != auth_expected_header_) {
            send_all(sock_fd, http_401());
            closesocket(sock_fd);
            return;
        }
    }

    std::string path = fullpath;
    std::string query;
    size_t qpos = fullpath.find('?');
    if (qpos != std::string::npos) {
        path = fullpath.substr(0, qpos);
        query = fullpath.substr(qpos + 1);
    }

    ControlResponse res;
    try {
        res = control_.handle(method, path, query, body);
    } catch (const std::exception &e) {
        safe_log_error(std::string("HttpServer: ") + method + " " + path + ": " + e.what());
        res = ControlResponse{500, std::string("internal error: ") + e.what() + "\n"};
    }
    safe_log_debug("HttpServer: " + method + " " + path + " -> " + std::to_string(res.code));

    send_all(sock_fd, http_response(res.code, res.body, res.content_type));
    closesocket(sock_fd);
}
