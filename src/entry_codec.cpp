#include "entry_codec.hpp"
#include "base64.hpp"
#include "errors.hpp"

#include <charconv>
#include <sstream>
#include <unordered_map>

const char *filter_reason_name(FilterReason r) noexcept {
    switch (r) {
        case FilterReason::NotFiltered: return "NotFilteredNotFound";
        case FilterReason::FilteredBlackList: return "FilteredBlackList";
        case FilterReason::FilteredSafeBrowsing: return "FilteredSafeBrowsing";
        case FilterReason::FilteredParental: return "FilteredParental";
        case FilterReason::FilteredInvalid: return "FilteredInvalid";
        case FilterReason::FilteredSafeSearch: return "FilteredSafeSearch";
        case FilterReason::NotFilteredWhiteList: return "NotFilteredWhiteList";
    }
    return "Unknown";
}

static bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~' || c == ':' || c == '/';
}

std::string percent_encode(const std::string &s) {
    static const char *hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string percent_decode(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') { out.push_back(s[i]); continue; }
        if (i + 2 >= s.size()) throw DecodeError("truncated percent escape");
        int hi = hex_value(s[i + 1]);
        int lo = hex_value(s[i + 2]);
        if (hi < 0 || lo < 0) throw DecodeError("bad percent escape");
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

static int64_t parse_i64(const std::string &key, const std::string &v) {
    int64_t out = 0;
    const char *first = v.data();
    const char *last = v.data() + v.size();
    auto r = std::from_chars(first, last, out);
    if (v.empty() || r.ec != std::errc() || r.ptr != last) {
        throw DecodeError("bad integer for '" + key + "': " + v);
    }
    return out;
}

static void check_payload(const char *what, const std::vector<uint8_t> &p) {
    if (p.size() > kMaxPayloadSize) {
        throw EncodeError(std::string(what) + " payload too large: " + std::to_string(p.size()) + " bytes");
    }
}

std::string encode_entry(const LogEntry &e) {
    check_payload("question", e.question);
    check_payload("answer", e.answer);
    int32_t reason = static_cast<int32_t>(e.result.reason);
    if (reason < 0 || reason > kMaxFilterReason) {
        throw EncodeError("unknown filter reason " + std::to_string(reason));
    }

    int64_t t = std::chrono::duration_cast<std::chrono::nanoseconds>(e.time.time_since_epoch()).count();
    std::ostringstream os;
    os << "v=" << kRecordVersion
       << "&t=" << t
       << "&q=" << percent_encode(base64_encode(e.question.data(), e.question.size()))
       << "&a=" << percent_encode(base64_encode(e.answer.data(), e.answer.size()))
       << "&ip=" << percent_encode(e.client)
       << "&up=" << percent_encode(e.upstream)
       << "&f=" << (e.result.filtered ? 1 : 0)
       << "&reason=" << reason
       << "&rule=" << percent_encode(e.result.rule)
       << "&fid=" << e.result.filter_id
       << "&el=" << e.elapsed.count();
    return os.str();
}

std::string encode_batch(const std::vector<LogEntry> &entries) {
    std::string out;
    for (const auto &e : entries) {
        out += encode_entry(e);
        out.push_back('\n');
    }
    return out;
}

LogEntry decode_entry(const std::string &raw) {
    std::string line = raw;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    if (line.empty()) throw DecodeError("empty record");

    std::unordered_map<std::string, std::string> kv;
    size_t pos = 0;
    while (pos <= line.size()) {
        size_t amp = line.find('&', pos);
        std::string pair = line.substr(pos, (amp == std::string::npos ? std::string::npos : amp - pos));
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) throw DecodeError("bad field '" + pair + "'");
        std::string k = pair.substr(0, eq);
        if (!kv.emplace(k, percent_decode(pair.substr(eq + 1))).second) {
            throw DecodeError("duplicate field '" + k + "'");
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }

    auto need = [&](const char *k) -> const std::string & {
        auto it = kv.find(k);
        if (it == kv.end()) throw DecodeError(std::string("missing field '") + k + "'");
        return it->second;
    };
    auto opt = [&](const char *k) -> const std::string * {
        auto it = kv.find(k);
        return it == kv.end() ? nullptr : &it->second;
    };

    int64_t ver = parse_i64("v", need("v"));
    if (ver != kRecordVersion) throw DecodeError("unsupported record version " + std::to_string(ver));

    LogEntry e;
    e.time = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(parse_i64("t", need("t")))));
    e.question = base64_decode(need("q"));
    if (const std::string *a = opt("a")) e.answer = base64_decode(*a);
    if (const std::string *ip = opt("ip")) e.client = *ip;
    if (const std::string *up = opt("up")) e.upstream = *up;
    if (const std::string *f = opt("f")) {
        if (*f == "1") e.result.filtered = true;
        else if (*f != "0") throw DecodeError("bad filtered flag: " + *f);
    }
    if (const std::string *r = opt("reason")) {
        int64_t reason = parse_i64("reason", *r);
        if (reason < 0 || reason > kMaxFilterReason) throw DecodeError("unknown filter reason " + *r);
        e.result.reason = static_cast<FilterReason>(reason);
    }
    if (const std::string *rule = opt("rule")) e.result.rule = *rule;
    if (const std::string *fid = opt("fid")) e.result.filter_id = parse_i64("fid", *fid);
    if (const std::string *el = opt("el")) e.elapsed = std::chrono::nanoseconds(parse_i64("el", *el));
    return e;
}

std::vector<LogEntry> decode_batch(const std::string &buf) {
    std::vector<LogEntry> out;
    std::istringstream in(buf);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        out.push_back(decode_entry(line));
    }
    return out;
}

void verify_encoded(const std::vector<LogEntry> &entries, const std::string &buf) {
    std::vector<LogEntry> decoded;
    try {
        decoded = decode_batch(buf);
    } catch (const DecodeError &e) {
        throw ConsistencyError(std::string("encoded buffer does not decode: ") + e.what());
    }
    if (decoded.size() != entries.size()) {
        throw ConsistencyError("check fail: " + std::to_string(entries.size()) + " vs " +
                               std::to_string(decoded.size()) + " entries");
    }
    for (size_t i = 0; i < decoded.size(); ++i) {
        if (decoded[i] != entries[i]) {
            throw ConsistencyError("decoded entry " + std::to_string(i) + " differs from source");
        }
    }
}
