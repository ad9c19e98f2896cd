#pragma once
#include <string>
#include <vector>

namespace textutil {

// lowercase, keep letters/digits/+/#, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop one-letter junk (except "c")
std::vector<std::string> tokenize(const std::string& normalized);

std::string trim(const std::string& s);

// occurrences of a normalized phrase in a normalized haystack, on word boundaries
size_t count_phrase(const std::string& normalized_haystack, const std::string& normalized_phrase);

size_t word_count(const std::string& raw);

}
