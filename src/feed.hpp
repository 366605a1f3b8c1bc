#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include "bounded_queue.hpp"

// Event feed readers. Each pushes one line per event into `bq` until end of
// input, `stop` is set or `bq` is closed, then closes `bq`.

// Waits on `fd` in short slices so `stop` is noticed while no input arrives.
// A final line without '\n' is delivered at end of input.
// Returns the number of lines pushed.
size_t read_feed_fd(int fd, BoundedQueue<std::string> &bq, const std::atomic<bool> &stop);

// Returns false if `path` cannot be opened.
bool read_feed_file(const std::string &path, BoundedQueue<std::string> &bq, const std::atomic<bool> &stop);
