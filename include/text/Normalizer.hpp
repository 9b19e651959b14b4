#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

constexpr size_t kMaxInputChars = 200;

// cut UTF-8 text after max_chars code points (never splits a sequence)
std::string clamp_utf8(const std::string& s, size_t max_chars = kMaxInputChars);

// lowercase, fold Latin diacritics to ASCII, drop apostrophes, turn everything
// else that is not [a-z0-9] into spaces, collapse spaces
std::string fold(const std::string& s);

// split folded text on spaces and drop stop words
std::vector<std::string> tokenize(const std::string& folded);

bool is_stop_word(const std::string& token);

std::string join_tokens(const std::vector<std::string>& tokens, size_t begin, size_t end);
std::string join_tokens(const std::vector<std::string>& tokens);

struct NormalizedText {
    std::string clamped;               // input after clamp_utf8
    std::vector<std::string> tokens;
    std::string text;                  // tokens joined by single spaces
};

// clamp + fold + tokenize; idempotent on its own `text` output
NormalizedText normalize(const std::string& raw);

}
