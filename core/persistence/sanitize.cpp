#include "persistence/sanitize.hpp"

#include <cctype>

namespace weave {

namespace {

bool isPlain(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

std::string sanitizeIdentifier(const std::string& id) {
    std::string out = id;
    for (char& c : out) {
        if (!isPlain(static_cast<unsigned char>(c))) c = '_';
    }
    return out;
}

std::string encodeKey(const std::string& key) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(key.size());
    for (char ch : key) {
        auto c = static_cast<unsigned char>(ch);
        if (isPlain(c)) {
            out += ch;
        } else {
            out += '~';
            out += digits[c >> 4];
            out += digits[c & 0x0f];
            out += '~';
        }
    }
    return out;
}

bool decodeKey(const std::string& encoded, std::string& out) {
    out.clear();
    for (size_t i = 0; i < encoded.size();) {
        char c = encoded[i];
        if (c != '~') {
            if (!isPlain(static_cast<unsigned char>(c))) return false;
            out += c;
            ++i;
            continue;
        }
        if (i + 3 >= encoded.size() || encoded[i + 3] != '~') return false;
        int hi = hexValue(encoded[i + 1]);
        int lo = hexValue(encoded[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out += static_cast<char>((hi << 4) | lo);
        i += 4;
    }
    return true;
}

} // namespace weave
