#include "base64.hpp"
#include "errors.hpp"

static const char *tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t *data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    size_t i = 0;
    while (i + 3 <= len) {
        unsigned a = data[i++];
        unsigned b = data[i++];
        unsigned c = data[i++];
        unsigned x = (a << 16) | (b << 8) | c;
        out.push_back(tbl[(x >> 18) & 0x3F]);
        out.push_back(tbl[(x >> 12) & 0x3F]);
        out.push_back(tbl[(x >> 6) & 0x3F]);
        out.push_back(tbl[x & 0x3F]);
    }
    size_t rem = len - i;
    if (rem == 1) {
        unsigned a = data[i++];
        unsigned x = a << 16;
        out.push_back(tbl[(x >> 18) & 0x3F]);
        out.push_back(tbl[(x >> 12) & 0x3F]);
        out.push_back('=');
        out.push_back('=');
    } else if (rem == 2) {
        unsigned a = data[i++];
        unsigned b = data[i++];
        unsigned x = (a << 16) | (b << 8);
        out.push_back(tbl[(x >> 18) & 0x3F]);
        out.push_back(tbl[(x >> 12) & 0x3F]);
        out.push_back(tbl[(x >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string base64_encode(const std::string &in) {
    return base64_encode(reinterpret_cast<const uint8_t *>(in.data()), in.size());
}

static int sextet(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::vector<uint8_t> base64_decode(const std::string &in) {
    if (in.size() % 4 != 0) throw DecodeError("base64 length not a multiple of 4");
    std::vector<uint8_t> out;
    out.reserve((in.size() / 4) * 3);
    for (size_t i = 0; i < in.size(); i += 4) {
        bool last = (i + 4 == in.size());
        int v[4];
        size_t pad = 0;
        for (size_t j = 0; j < 4; ++j) {
            char c = in[i + j];
            if (c == '=') {
                // padding only in the last two slots of the final quantum
                if (!last || j < 2) throw DecodeError("misplaced base64 padding");
                v[j] = 0;
                ++pad;
                continue;
            }
            if (pad > 0) throw DecodeError("data after base64 padding");
            v[j] = sextet(c);
            if (v[j] < 0) throw DecodeError("invalid base64 character");
        }
        unsigned x = (static_cast<unsigned>(v[0]) << 18) | (static_cast<unsigned>(v[1]) << 12) |
                     (static_cast<unsigned>(v[2]) << 6) | static_cast<unsigned>(v[3]);
        out.push_back(static_cast<uint8_t>((x >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<uint8_t>(x & 0xFF));
    }
    return out;
}
