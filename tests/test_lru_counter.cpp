// tests/test_lru_counter.cpp
#include <iostream>
#include <string>

#include "../src/lru_counter.hpp"

int main() {
    LruCounter c(3);
    c.increment("a");
    c.increment("b");
    c.increment("c");
    c.increment("a", 4);    // a is now most recent

    if (c.get("a") != 5 || c.get("b") != 1) {
        std::cerr << "lru_counter: counts wrong\n";
        return 1;
    }

    // new key evicts the least recently incremented one (b)
    c.increment("d");
    if (c.size() != 3 || c.get("b") != 0 || c.get("c") != 1 || c.evictions() != 1) {
        std::cerr << "lru_counter: expected b to be evicted\n";
        return 2;
    }

    // evicted keys restart from zero
    if (c.increment("b") != 1) {
        std::cerr << "lru_counter: evicted key kept its old count\n";
        return 3;
    }

    uint64_t total = 0;
    size_t keys = 0;
    c.for_each([&](const std::string &, uint64_t v){ total += v; ++keys; });
    if (keys != 3 || total != 5 + 1 + 1) {
        std::cerr << "lru_counter: for_each saw " << keys << " keys, total " << total << "\n";
        return 4;
    }

    // size never goes above capacity
    LruCounter big(100);
    for (int i = 0; i < 10000; ++i) big.increment("k" + std::to_string(i % 250));
    if (big.size() != 100) {
        std::cerr << "lru_counter: size " << big.size() << " above capacity\n";
        return 5;
    }

    c.clear();
    if (c.size() != 0 || c.get("a") != 0) {
        std::cerr << "lru_counter: clear left keys\n";
        return 6;
    }

    std::cout << "test_lru_counter: OK\n";
    return 0;
}
