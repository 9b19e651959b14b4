#include "text/Normalizer.hpp"
#include <cstdint>
#include <unordered_set>

namespace textutil {

static const uint32_t kInvalid = 0xFFFD;

// Decode one code point starting at s[i]; returns the number of bytes consumed
// (>= 1). Malformed sequences decode to U+FFFD and consume a single byte.
static size_t decode_utf8(const std::string& s, size_t i, uint32_t& cp) {
    const unsigned char b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    size_t len = 0;
    uint32_t v = 0;
    if ((b0 & 0xE0) == 0xC0) { len = 2; v = b0 & 0x1F; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; v = b0 & 0x0F; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; v = b0 & 0x07; }
    else {
        cp = kInvalid;
        return 1;
    }

    if (i + len > s.size()) {
        cp = kInvalid;
        return 1;
    }
    for (size_t k = 1; k < len; ++k) {
        const unsigned char b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) {
            cp = kInvalid;
            return 1;
        }
        v = (v << 6) | (b & 0x3F);
    }

    // overlong forms, surrogates and values past U+10FFFF
    static const uint32_t kMinForLen[] = {0, 0, 0x80, 0x800, 0x10000};
    if (v < kMinForLen[len] || (v >= 0xD800 && v <= 0xDFFF) || v > 0x10FFFF) {
        cp = kInvalid;
        return 1;
    }
    cp = v;
    return len;
}

struct FoldRange {
    uint32_t first;
    uint32_t last;
    const char* ascii;
};

// Latin-1 Supplement + Latin Extended-A letters -> ASCII base letters.
// Upper and lower case share a range where they interleave.
static const FoldRange kFoldTable[] = {
    {0x00C0, 0x00C5, "a"}, {0x00C6, 0x00C6, "ae"}, {0x00C7, 0x00C7, "c"},
    {0x00C8, 0x00CB, "e"}, {0x00CC, 0x00CF, "i"}, {0x00D0, 0x00D0, "d"},
    {0x00D1, 0x00D1, "n"}, {0x00D2, 0x00D6, "o"}, {0x00D8, 0x00D8, "o"},
    {0x00D9, 0x00DC, "u"}, {0x00DD, 0x00DD, "y"}, {0x00DE, 0x00DE, "th"},
    {0x00DF, 0x00DF, "ss"},
    {0x00E0, 0x00E5, "a"}, {0x00E6, 0x00E6, "ae"}, {0x00E7, 0x00E7, "c"},
    {0x00E8, 0x00EB, "e"}, {0x00EC, 0x00EF, "i"}, {0x00F0, 0x00F0, "d"},
    {0x00F1, 0x00F1, "n"}, {0x00F2, 0x00F6, "o"}, {0x00F8, 0x00F8, "o"},
    {0x00F9, 0x00FC, "u"}, {0x00FD, 0x00FD, "y"}, {0x00FE, 0x00FE, "th"},
    {0x00FF, 0x00FF, "y"},
    {0x0100, 0x0105, "a"}, {0x0106, 0x010D, "c"}, {0x010E, 0x0111, "d"},
    {0x0112, 0x011B, "e"}, {0x011C, 0x0123, "g"}, {0x0124, 0x0127, "h"},
    {0x0128, 0x0131, "i"}, {0x0132, 0x0133, "ij"}, {0x0134, 0x0135, "j"},
    {0x0136, 0x0138, "k"}, {0x0139, 0x0142, "l"}, {0x0143, 0x014B, "n"},
    {0x014C, 0x0151, "o"}, {0x0152, 0x0153, "oe"}, {0x0154, 0x0159, "r"},
    {0x015A, 0x0161, "s"}, {0x0162, 0x0167, "t"}, {0x0168, 0x0173, "u"},
    {0x0174, 0x0175, "w"}, {0x0176, 0x0178, "y"}, {0x0179, 0x017E, "z"},
    {0x017F, 0x017F, "s"},
};

static const char* fold_latin(uint32_t cp) {
    for (const auto& r : kFoldTable) {
        if (cp >= r.first && cp <= r.last) return r.ascii;
    }
    return nullptr;
}

static bool is_dropped(uint32_t cp) {
    // apostrophes join the word ("mom's" -> "moms"), combining marks vanish
    if (cp == '\'' || cp == 0x2018 || cp == 0x2019) return true;
    return cp >= 0x0300 && cp <= 0x036F;
}

std::string clamp_utf8(const std::string& s, size_t max_chars) {
    size_t i = 0;
    size_t n = 0;
    while (i < s.size() && n < max_chars) {
        uint32_t cp = 0;
        i += decode_utf8(s, i, cp);
        ++n;
    }
    return s.substr(0, i);
}

std::string fold(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    auto push_kept = [&](const char* ascii) {
        for (const char* p = ascii; *p; ++p) out.push_back(*p);
        prev_space = false;
    };

    for (size_t i = 0; i < s.size(); ) {
        uint32_t cp = 0;
        i += decode_utf8(s, i, cp);

        if (cp < 0x80) {
            char c = static_cast<char>(cp);
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
                out.push_back(c);
                prev_space = false;
                continue;
            }
        }

        if (is_dropped(cp)) continue;

        if (const char* ascii = fold_latin(cp)) {
            push_kept(ascii);
            continue;
        }

        // punctuation, symbols, emoji, non-Latin scripts
        if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

bool is_stop_word(const std::string& token) {
    static const std::unordered_set<std::string> stop = {
        "a", "an", "the", "to", "my"
    };
    return stop.count(token) > 0;
}

std::vector<std::string> tokenize(const std::string& folded) {
    std::vector<std::string> tokens;
    std::string cur;

    auto flush = [&]() {
        if (!cur.empty()) {
            if (!is_stop_word(cur)) tokens.push_back(cur);
            cur.clear();
        }
    };

    for (char c : folded) {
        if (c == ' ') flush();
        else cur.push_back(c);
    }
    flush();
    return tokens;
}

std::string join_tokens(const std::vector<std::string>& tokens, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end && i < tokens.size(); ++i) {
        if (i > begin) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    return join_tokens(tokens, 0, tokens.size());
}

NormalizedText normalize(const std::string& raw) {
    NormalizedText nt;
    nt.clamped = clamp_utf8(raw);
    // folding can lengthen text (ss, ae, th), so clamp its output too
    nt.tokens = tokenize(clamp_utf8(fold(nt.clamped)));
    nt.text = join_tokens(nt.tokens);
    return nt;
}

}
