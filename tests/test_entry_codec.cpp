// tests/test_entry_codec.cpp
#include <iostream>
#include <string>
#include <vector>

#include "../src/base64.hpp"
#include "../src/dns_question.hpp"
#include "../src/entry_codec.hpp"
#include "../src/errors.hpp"

static LogEntry sample_entry() {
    LogEntry e;
    e.time = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)) + std::chrono::microseconds(123456);
    e.question = build_query("example.org", kQTypeAAAA, 0x1234);
    e.answer = {0x12, 0x34, 0x81, 0x80, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
    e.client = "192.168.1.5";
    e.upstream = "tls://1.1.1.1:853";
    e.result.filtered = true;
    e.result.reason = FilterReason::FilteredBlackList;
    e.result.rule = "||example.org^$important,client=a&b=100%";
    e.result.filter_id = 42;
    e.elapsed = std::chrono::nanoseconds(1234567);
    return e;
}

template<typename Fn>
static bool throws_decode(Fn fn) {
    try {
        fn();
    } catch (const DecodeError &) {
        return true;
    }
    return false;
}

template<typename Fn>
static bool throws_consistency(Fn fn) {
    try {
        fn();
    } catch (const ConsistencyError &) {
        return true;
    }
    return false;
}

int main() {
    // base64 helpers
    if (base64_encode(std::string("foobar")) != "Zm9vYmFy" || base64_encode(std::string("fo")) != "Zm8=") {
        std::cerr << "base64_encode mismatch\n";
        return 1;
    }
    auto foob = base64_decode("Zm9vYg==");
    if (std::string(foob.begin(), foob.end()) != "foob") {
        std::cerr << "base64_decode mismatch\n";
        return 2;
    }
    if (!throws_decode([]{ base64_decode("Zm9"); }) || !throws_decode([]{ base64_decode("Zm=v"); })
        || !throws_decode([]{ base64_decode("Zm9*"); })) {
        std::cerr << "base64_decode accepted bad input\n";
        return 3;
    }

    // question helpers
    auto name = extract_query_name(build_query("Example.ORG."));
    if (!name || *name != "example.org") {
        std::cerr << "extract_query_name mismatch\n";
        return 4;
    }
    auto q = parse_question(build_query("ipv6.example", kQTypeAAAA));
    if (!q || q->qtype != kQTypeAAAA || q->qclass != 1 || qtype_to_string(q->qtype) != "AAAA") {
        std::cerr << "parse_question mismatch\n";
        return 5;
    }
    // name behind a compression pointer that jumps past the question
    std::vector<uint8_t> ptr_msg = {0,0, 1,0, 0,1, 0,0, 0,0, 0,0,
                                    0xC0, 18, 0,1, 0,1,
                                    7,'e','x','a','m','p','l','e', 3,'o','r','g', 0};
    name = extract_query_name(ptr_msg);
    if (!name || *name != "example.org") {
        std::cerr << "compressed name not followed\n";
        return 6;
    }
    std::vector<uint8_t> loop_msg = {0,0, 1,0, 0,1, 0,0, 0,0, 0,0, 0xC0, 12, 0,1, 0,1};
    std::vector<uint8_t> short_msg = {0,0, 1,0, 0,1};
    if (extract_query_name(loop_msg) || extract_query_name(short_msg) || extract_query_name({})) {
        std::cerr << "malformed question accepted\n";
        return 7;
    }

    // round trip
    LogEntry e = sample_entry();
    std::string line = encode_entry(e);
    if (line.find('\n') != std::string::npos) {
        std::cerr << "encoded record spans lines: " << line << "\n";
        return 8;
    }
    if (decode_entry(line) != e) {
        std::cerr << "round trip mismatch for " << line << "\n";
        return 9;
    }

    LogEntry minimal;
    minimal.time = std::chrono::system_clock::time_point(std::chrono::seconds(1));
    minimal.question = build_query("a.b");
    std::vector<LogEntry> batch = {e, minimal, e};
    std::string buf = encode_batch(batch);
    if (decode_batch(buf) != batch) {
        std::cerr << "batch round trip mismatch\n";
        return 10;
    }

    // forward compatibility and terminators
    if (decode_entry(line + "&zz=future\r\n") != e) {
        std::cerr << "unknown key or line terminator not tolerated\n";
        return 11;
    }

    // corrupt records
    const std::vector<std::string> bad = {
        "",
        "garbage",
        "t=1&q=",
        "v=1&q=",
        "v=2&t=1&q=",
        "v=1&t=12x&q=",
        "v=1&t=1&q=@@@@",
        "v=1&t=1&q=&reason=9",
        "v=1&t=1&q=&f=2",
        "v=1&t=1&q=&rule=%G1",
        "v=1&t=1&t=2&q=",
    };
    for (const auto &b : bad) {
        if (!throws_decode([&]{ decode_entry(b); })) {
            std::cerr << "decode accepted corrupt record: '" << b << "'\n";
            return 12;
        }
    }

    // encode limits
    LogEntry big = e;
    big.question.assign(kMaxPayloadSize + 1, 0);
    try {
        encode_entry(big);
        std::cerr << "oversized question encoded\n";
        return 13;
    } catch (const EncodeError &) {}

    LogEntry odd = e;
    odd.result.reason = static_cast<FilterReason>(42);
    try {
        encode_batch({e, odd});
        std::cerr << "out of range reason encoded\n";
        return 14;
    } catch (const EncodeError &) {}

    // a buffer that does not match its source entries is rejected before writing
    {
        std::vector<LogEntry> src{sample_entry(), sample_entry()};
        src[1].client = "10.0.0.2";
        const std::string buf = encode_batch(src);
        verify_encoded(src, buf);

        std::string tampered = buf;
        auto pos = tampered.find("ip=192.168.1.5");
        if (pos == std::string::npos) {
            std::cerr << "encoded client not found\n";
            return 15;
        }
        tampered.replace(pos, 14, "ip=192.168.1.6");
        if (!throws_consistency([&]{ verify_encoded(src, tampered); })) {
            std::cerr << "verify_encoded accepted a changed entry\n";
            return 16;
        }

        std::string dropped = buf.substr(0, buf.find('\n') + 1);
        if (!throws_consistency([&]{ verify_encoded(src, dropped); })) {
            std::cerr << "verify_encoded accepted a missing entry\n";
            return 17;
        }
        if (!throws_consistency([&]{ verify_encoded(src, "v=1&q=%%%\n"); })) {
            std::cerr << "verify_encoded accepted an undecodable buffer\n";
            return 18;
        }
    }

    std::cout << "test_entry_codec: OK\n";
    return 0;
}
