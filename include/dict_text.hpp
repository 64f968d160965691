#pragma once
#include <cctype>
#include <string>

namespace dictlsp {

inline std::string to_lower_ascii(std::string s) {
    for (char &c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// Decode UTF-8 into code points. Invalid bytes become U+FFFD.
inline std::u32string utf8_decode(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = (unsigned char)s[i];
        char32_t cp = 0;
        size_t extra = 0;

        if (c < 0x80) { cp = c; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else { out.push_back(0xFFFD); i++; continue; }

        // Truncated sequence at end of input
        if (i + extra >= s.size() && extra > 0) {
            out.push_back(0xFFFD);
            break;
        }

        bool ok = true;
        for (size_t k = 1; k <= extra; k++) {
            unsigned char cc = (unsigned char)s[i + k];
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok) {
            out.push_back(0xFFFD);
            i++;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

inline void utf8_append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

inline std::string utf8_encode(const std::u32string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : s) utf8_append(out, cp);
    return out;
}

// Simple case folding: ASCII, Latin-1, Latin Extended-A, Greek, Cyrillic
inline char32_t fold_case(char32_t c) {
    if (c < 0x80) return (c >= 'A' && c <= 'Z') ? c + 32 : c;
    if (c >= 0xC0 && c <= 0xDE && c != 0xD7) return c + 0x20;
    if (c >= 0x100 && c <= 0x137) return c | 1;
    if (c >= 0x139 && c <= 0x148) return (c & 1) ? c + 1 : c;
    if (c >= 0x14A && c <= 0x177) return c | 1;
    if (c >= 0x391 && c <= 0x3A9 && c != 0x3A2) return c + 0x20;
    if (c >= 0x410 && c <= 0x42F) return c + 0x20;
    if (c >= 0x400 && c <= 0x40F) return c + 0x50;
    return c;
}

inline char32_t upper_case(char32_t c) {
    if (c < 0x80) return (c >= 'a' && c <= 'z') ? c - 32 : c;
    if (c >= 0xE0 && c <= 0xFE && c != 0xF7) return c - 0x20;
    if (c >= 0x100 && c <= 0x137) return c & ~(char32_t)1;
    if (c >= 0x139 && c <= 0x148) return (c & 1) ? c : c - 1;
    if (c >= 0x14A && c <= 0x177) return c & ~(char32_t)1;
    if (c >= 0x3B1 && c <= 0x3C9 && c != 0x3C2) return c - 0x20;
    if (c >= 0x430 && c <= 0x44F) return c - 0x20;
    if (c >= 0x450 && c <= 0x45F) return c - 0x50;
    return c;
}

inline bool is_upper(char32_t c) {
    return fold_case(c) != c;
}

// Letters and digits. Non-ASCII code points count as letters unless they sit
// in a known punctuation or symbol block.
inline bool is_word_char(char32_t c) {
    if (c < 0x80) return std::isalnum((int)c) != 0;
    if (c < 0xC0) return c == 0xAA || c == 0xB5 || c == 0xBA;
    if (c == 0xD7 || c == 0xF7) return false;
    if (c >= 0x2000 && c <= 0x2BFF) return false; // punctuation, symbols, arrows
    if (c >= 0x3000 && c <= 0x303F) return false; // CJK punctuation
    if (c >= 0xFE30 && c <= 0xFE4F) return false;
    if (c >= 0xFF00 && c <= 0xFF0F) return false;
    if (c >= 0xFF1A && c <= 0xFF20) return false;
    if (c == 0xFFFD) return false;
    return true;
}

// Characters allowed inside a word when surrounded by word characters
inline bool is_word_joiner(char32_t c) {
    return c == '-' || c == '\'' || c == 0x2019;
}

// Case-fold and trim a dictionary key or query word
inline std::string normalize_word(const std::string& s) {
    std::u32string cps = utf8_decode(s);

    size_t b = 0;
    size_t e = cps.size();
    while (b < e && cps[b] < 0x80 && std::isspace((int)cps[b])) b++;
    while (e > b && cps[e - 1] < 0x80 && std::isspace((int)cps[e - 1])) e--;

    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; i++) utf8_append(out, fold_case(cps[i]));
    return out;
}

// Uppercase the first code point ("passion" -> "Passion")
inline std::string capitalize_first(const std::string& s) {
    std::u32string cps = utf8_decode(s);
    if (cps.empty()) return s;
    cps[0] = upper_case(cps[0]);
    return utf8_encode(cps);
}

} // namespace dictlsp
