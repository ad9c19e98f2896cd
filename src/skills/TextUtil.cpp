#include "skills/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            (c == '+') || (c == '#'); // keeps "c++" and "c#"

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    auto flush = [&] {
        if (cur.size() >= 2 || cur == "c") tokens.push_back(cur);
        cur.clear();
    };

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) flush();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) flush();
    return tokens;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace((unsigned char)s[i])) ++i;
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

size_t count_phrase(const std::string& normalized_haystack, const std::string& normalized_phrase) {
    if (normalized_phrase.empty()) return 0;

    // pad with spaces to enforce word boundaries
    const std::string h = " " + normalized_haystack + " ";
    const std::string p = " " + normalized_phrase + " ";

    size_t n = 0;
    size_t pos = h.find(p);
    while (pos != std::string::npos) {
        ++n;
        // step past the phrase but keep its trailing space as the next leading boundary
        pos = h.find(p, pos + p.size() - 1);
    }
    return n;
}

size_t word_count(const std::string& raw) {
    size_t n = 0;
    bool in_word = false;
    for (unsigned char c : raw) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++n;
        }
    }
    return n;
}

}
