// src/worker_pool.cpp
// Worker pool that consumes event lines from a bounded queue, parses them
// into LogEntry values and hands them to QueryLog::ingest. Worker bodies are
// wrapped in try/catch and report exceptions via safe_log_error().

#include "worker_pool.hpp"
#include "util_log.hpp"
#include "parser.hpp"
#include <exception>

WorkerPool::WorkerPool(size_t num_workers, BoundedQueue<std::string> &queue_, QueryLog &ql)
    : queue(queue_), query_log(ql)
{
    size_t n = (num_workers == 0) ? 1 : num_workers;
    workers.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers.emplace_back([this, i]() {
            std::string line;
            while (queue.pop(line)) {
                if (line.empty() || line[0] == '#') continue;
                try {
                    auto parsed = parse_query_event(line);
                    if (!parsed) {
                        parse_errors_.fetch_add(1);
                        safe_log_debug("worker " + std::to_string(i) + ": unparseable event: " + line);
                        continue;
                    }
                    IngestResult r = query_log.ingest(*parsed);
                    if (r == IngestResult::Accepted) {
                        accepted_.fetch_add(1);
                    } else {
                        rejected_.fetch_add(1);
                        safe_log_debug(std::string("worker: event rejected (") + ingest_result_name(r) + "): " + line);
                    }
                } catch (const std::exception &ex) {
                    parse_errors_.fetch_add(1);
                    safe_log_error(std::string("Exception while handling event in worker: ") + ex.what());
                }
            }
        });
    }
}

void WorkerPool::join() {
    queue.close();
    for (auto &t : workers) {
        if (t.joinable()) t.join();
    }
}

WorkerPool::~WorkerPool() {
    join();
}
