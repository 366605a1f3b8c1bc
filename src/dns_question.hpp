#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr uint16_t kQTypeA = 1;
constexpr uint16_t kQTypeAAAA = 28;

struct DnsQuestion {
    std::string name;   // lowercase, no trailing dot
    uint16_t qtype = 0;
    uint16_t qclass = 0;
};

// The single question of a wire-format DNS message; nullopt if the message is
// truncated, malformed, carries no question or more than one, or asks for the root.
std::optional<DnsQuestion> parse_question(const std::vector<uint8_t> &msg);

// Name of the single question in a wire-format DNS message, lowercased and
// without the trailing dot. nullopt if the message is truncated, malformed,
// carries no question or more than one, or the name is the root.
std::optional<std::string> extract_query_name(const std::vector<uint8_t> &msg);

// Builds a recursion-desired query for `name`. Throws std::invalid_argument on
// labels longer than 63 bytes or names longer than 255 bytes.
std::vector<uint8_t> build_query(const std::string &name, uint16_t qtype = kQTypeA, uint16_t id = 0);

// 1 -> "A"; unknown types as "TYPE<n>"
std::string qtype_to_string(uint16_t qtype);

// "A" -> 1, "AAAA" -> 28, numeric strings as-is; 0 when unknown
uint16_t qtype_from_string(const std::string &s);
