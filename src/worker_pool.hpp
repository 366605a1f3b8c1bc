#pragma once
#include "bounded_queue.hpp"
#include "query_log.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <thread>


// Parses event feed lines off the queue and ingests them into the query log.
// Workers run until the queue is closed and drained.
class WorkerPool {
std::vector<std::thread> workers;
BoundedQueue<std::string> &queue;
QueryLog &query_log;
std::atomic<uint64_t> accepted_{0};
std::atomic<uint64_t> rejected_{0};
std::atomic<uint64_t> parse_errors_{0};
public:
WorkerPool(size_t n, BoundedQueue<std::string> &q, QueryLog &ql);
~WorkerPool();

// Closes the queue and waits for the workers to drain it.
void join();

uint64_t accepted() const { return accepted_.load(); }
uint64_t rejected() const { return rejected_.load(); }
uint64_t parse_errors() const { return parse_errors_.load(); }
};
