#include "dns_question.hpp"
#include <cctype>
#include <stdexcept>

static constexpr int kMaxNameDepth = 16;
static constexpr size_t kMaxNameLength = 255;
static constexpr size_t kHeaderSize = 12;

static uint16_t read16(const uint8_t *p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

// Follows compression pointers up to kMaxNameDepth jumps.
static bool parse_name(const uint8_t *data, size_t length, size_t offset, int depth,
                       std::string &name, size_t &next) {
    if (depth > kMaxNameDepth || offset >= length) return false;

    size_t pos = offset;
    bool jumped = false;
    while (true) {
        if (pos >= length) return false;
        uint8_t len = data[pos];

        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= length) return false;
            size_t ptr = (static_cast<size_t>(len & 0x3F) << 8) | data[pos + 1];
            if (ptr >= length) return false;
            if (!jumped) { next = pos + 2; jumped = true; }
            size_t ignored = 0;
            std::string rest;
            if (!parse_name(data, length, ptr, depth + 1, rest, ignored)) return false;
            if (!name.empty() && !rest.empty()) name.push_back('.');
            name += rest;
            break;
        }
        if ((len & 0xC0) != 0) return false; // reserved label types

        if (len == 0) {
            if (!jumped) next = pos + 1;
            break;
        }

        if (pos + 1 + len > length) return false;
        if (name.size() + len + (name.empty() ? 0 : 1) > kMaxNameLength) return false;

        if (!name.empty()) name.push_back('.');
        name.append(reinterpret_cast<const char *>(data + pos + 1), len);
        pos += 1 + len;
    }
    return name.size() <= kMaxNameLength;
}

std::optional<DnsQuestion> parse_question(const std::vector<uint8_t> &msg) {
    if (msg.size() < kHeaderSize) return std::nullopt;
    const uint8_t *data = msg.data();
    uint16_t qdcount = read16(data + 4);
    if (qdcount != 1) return std::nullopt;

    DnsQuestion q;
    size_t next = kHeaderSize;
    if (!parse_name(data, msg.size(), kHeaderSize, 0, q.name, next)) return std::nullopt;
    // qtype + qclass must follow
    if (next + 4 > msg.size()) return std::nullopt;
    q.qtype = read16(data + next);
    q.qclass = read16(data + next + 2);

    for (auto &c : q.name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    while (!q.name.empty() && q.name.back() == '.') q.name.pop_back();
    if (q.name.empty()) return std::nullopt;
    return q;
}

std::optional<std::string> extract_query_name(const std::vector<uint8_t> &msg) {
    auto q = parse_question(msg);
    if (!q) return std::nullopt;
    return q->name;
}

std::vector<uint8_t> build_query(const std::string &name, uint16_t qtype, uint16_t id) {
    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + name.size() + 6);
    out.push_back(static_cast<uint8_t>(id >> 8));
    out.push_back(static_cast<uint8_t>(id & 0xFF));
    out.push_back(0x01); // RD
    out.push_back(0x00);
    out.push_back(0x00); out.push_back(0x01); // qdcount
    for (int i = 0; i < 6; ++i) out.push_back(0x00);

    std::string n = name;
    if (!n.empty() && n.back() == '.') n.pop_back();
    if (n.size() > kMaxNameLength - 2) throw std::invalid_argument("name too long: " + name);

    size_t pos = 0;
    while (pos < n.size()) {
        size_t dot = n.find('.', pos);
        size_t end = (dot == std::string::npos) ? n.size() : dot;
        size_t len = end - pos;
        if (len == 0 || len > 63) throw std::invalid_argument("bad label in name: " + name);
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), n.begin() + static_cast<std::ptrdiff_t>(pos), n.begin() + static_cast<std::ptrdiff_t>(end));
        pos = end + 1;
    }
    out.push_back(0x00);

    out.push_back(static_cast<uint8_t>(qtype >> 8));
    out.push_back(static_cast<uint8_t>(qtype & 0xFF));
    out.push_back(0x00); out.push_back(0x01); // IN
    return out;
}

struct QTypeName {
    uint16_t type;
    const char *name;
};

static const QTypeName kQTypeNames[] = {
    {kQTypeA, "A"}, {2, "NS"}, {5, "CNAME"}, {6, "SOA"}, {12, "PTR"}, {15, "MX"},
    {16, "TXT"}, {kQTypeAAAA, "AAAA"}, {33, "SRV"}, {65, "HTTPS"}, {255, "ANY"},
};

std::string qtype_to_string(uint16_t qtype) {
    for (const auto &t : kQTypeNames) {
        if (t.type == qtype) return t.name;
    }
    return "TYPE" + std::to_string(qtype);
}

uint16_t qtype_from_string(const std::string &s) {
    for (const auto &t : kQTypeNames) {
        if (s == t.name) return t.type;
    }
    if (s.empty() || s.size() > 5) return 0;
    unsigned long v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
        v = v * 10 + static_cast<unsigned long>(c - '0');
    }
    return v > 0xFFFF ? 0 : static_cast<uint16_t>(v);
}
