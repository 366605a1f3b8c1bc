#pragma once
#include <string>
#include <vector>
#include "entry.hpp"

// Record format version written in the "v" field.
constexpr int kRecordVersion = 1;

// Largest payload a DNS message can carry.
constexpr size_t kMaxPayloadSize = 65535;

// One record per line: "&"-separated key=value pairs with percent-encoded
// values. No trailing newline. Throws EncodeError.
std::string encode_entry(const LogEntry &e);

// Lines of all entries, each terminated by '\n'. Throws EncodeError.
std::string encode_batch(const std::vector<LogEntry> &entries);

// Accepts a line with or without its terminator. Throws DecodeError.
LogEntry decode_entry(const std::string &line);

// Decodes every non-empty line of `buf`. Throws DecodeError on the first bad one.
std::vector<LogEntry> decode_batch(const std::string &buf);

// Decodes `buf` and compares it entry by entry against `entries`.
// Throws ConsistencyError on any difference or if `buf` does not decode.
void verify_encoded(const std::vector<LogEntry> &entries, const std::string &buf);

std::string percent_encode(const std::string &s);
// Strict: a malformed escape throws DecodeError.
std::string percent_decode(const std::string &s);
