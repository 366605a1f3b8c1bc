// src/feed.cpp
#include "feed.hpp"
#include "util_log.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#if defined(_WIN32)
  #include <io.h>
#else
  #include <poll.h>
  #include <unistd.h>
#endif

static constexpr int kPollSliceMs = 200;

// Bytes read (0 at end of input), -1 on error, -2 when nothing arrived this slice.
static long read_some(int fd, char *buf, size_t len) {
#if defined(_WIN32)
    // console and pipe handles cannot be polled; this read blocks
    int n = _read(fd, buf, static_cast<unsigned>(len));
    if (n < 0) {
        safe_log_error(std::string("feed: read failed: ") + std::strerror(errno));
        return -1;
    }
    return n;
#else
    pollfd p;
    p.fd = fd;
    p.events = POLLIN;
    p.revents = 0;
    int pr = ::poll(&p, 1, kPollSliceMs);
    if (pr < 0) {
        if (errno == EINTR) return -2;
        safe_log_error(std::string("feed: poll failed: ") + std::strerror(errno));
        return -1;
    }
    if (pr == 0) return -2;

    ssize_t n = ::read(fd, buf, len);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return -2;
        safe_log_error(std::string("feed: read failed: ") + std::strerror(errno));
        return -1;
    }
    return static_cast<long>(n);
#endif
}

size_t read_feed_fd(int fd, BoundedQueue<std::string> &bq, const std::atomic<bool> &stop) {
    size_t pushed = 0;
    std::string pending;
    char buf[8192];
    bool eof = false;
    bool open = true;
    while (open && !stop.load()) {
        long n = read_some(fd, buf, sizeof(buf));
        if (n == -2) continue;
        if (n < 0) break;
        if (n == 0) {
            eof = true;
            break;
        }
        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0, nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            if (!bq.push(pending.substr(start, nl - start))) {
                open = false;
                break;
            }
            ++pushed;
            start = nl + 1;
        }
        pending.erase(0, start);
    }
    if (open && eof && !pending.empty() && bq.push(std::move(pending))) ++pushed;
    bq.close();
    safe_log_debug("feed: " + std::to_string(pushed) + " lines read");
    return pushed;
}

bool read_feed_file(const std::string &path, BoundedQueue<std::string> &bq, const std::atomic<bool> &stop) {
    std::ifstream in(path, std::ios::in);
    if (!in) {
        safe_log_error(std::string("feed: failed to open ") + path);
        bq.close();
        return false;
    }
    std::string line;
    while (!stop.load() && std::getline(in, line)) {
        if (!bq.push(std::move(line))) break;
    }
    bq.close();
    return true;
}
