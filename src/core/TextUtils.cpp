/**
 * TextUtils.cpp - Utterance normalization, hashing and base64
 */

#include "vsp/core/TextUtils.hpp"

#include <array>
#include <cctype>

namespace vsp::core {

namespace {

const char* B64_TABLE = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isTerminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

} // anonymous namespace

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::string normalizeUtterance(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool pending_space = false;
    for (char c : text) {
        if (isSpace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    while (!out.empty() && (isTerminal(out.back()) || out.back() == ',' || isSpace(out.back()))) {
        out.pop_back();
    }
    return out;
}

uint64_t hashText(const std::string& text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool endsWithTerminalPunctuation(const std::string& text) {
    std::string trimmed = trim(text);
    return !trimmed.empty() && isTerminal(trimmed.back());
}

std::string joinFragments(const std::string& head, const std::string& tail) {
    std::string a = trim(head);
    std::string b = trim(tail);
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + " " + b;
}

std::string base64Encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve((size + 2) / 3 * 4);

    int val = 0;
    int valb = -6;
    for (size_t i = 0; i < size; ++i) {
        val = ((val << 8) | data[i]) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            out.push_back(B64_TABLE[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) out.push_back(B64_TABLE[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4) out.push_back('=');
    return out;
}

std::vector<uint8_t> base64Decode(const std::string& encoded) {
    std::array<int, 256> lookup;
    lookup.fill(-1);
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(B64_TABLE[i])] = i;
    }

    std::vector<uint8_t> out;
    out.reserve(encoded.size() * 3 / 4);

    int val = 0;
    int valb = -8;
    for (unsigned char c : encoded) {
        if (lookup[c] == -1) break;
        val = ((val << 6) | lookup[c]) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return out;
}

} // namespace vsp::core
