#pragma once
#include <chrono>
#include <string>
#include <optional>
#include "entry.hpp"

// One event feed line:
//   <client> <name> [<qtype>] [ok|blocked[:<rule>]] [<elapsed_us>]
// e.g. "192.168.1.5 example.org AAAA blocked:||example.org^ 850".
// qtype defaults to A, verdict to ok, elapsed to 0. Returns nullopt on
// malformed lines, unknown query types and names that can't be encoded.
std::optional<LogEntry> parse_query_event(const std::string &line,
                                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
