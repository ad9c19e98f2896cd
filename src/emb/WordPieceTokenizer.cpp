#include "emb/WordPieceTokenizer.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

void WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) throw std::runtime_error("WordPieceTokenizer: cannot open vocab " + vocab_path);

    m_ids.clear();
    m_tokens.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        m_ids.emplace(line, (int64_t)m_tokens.size());
        m_tokens.push_back(line);
    }

    auto special = [this, &vocab_path](const char* tok) {
        auto it = m_ids.find(tok);
        if (it == m_ids.end()) {
            throw std::runtime_error(std::string("WordPieceTokenizer: vocab lacks ") + tok + ": " + vocab_path);
        }
        return it->second;
    };
    m_cls = special("[CLS]");
    m_sep = special("[SEP]");
    m_unk = special("[UNK]");
}

std::vector<std::string> WordPieceTokenizer::split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string cur;

    for (unsigned char c : text) {
        if (std::isspace(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else if (std::ispunct(c)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
            words.emplace_back(1, (char)c);
        } else {
            cur.push_back((char)std::tolower(c));
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

void WordPieceTokenizer::append_pieces(const std::string& word, std::vector<int64_t>& out) const {
    std::vector<int64_t> pieces;
    size_t start = 0;

    while (start < word.size()) {
        int64_t found = -1;
        size_t len = word.size() - start;

        for (; len > 0; --len) {
            std::string candidate = (start == 0 ? "" : "##") + word.substr(start, len);
            auto it = m_ids.find(candidate);
            if (it != m_ids.end()) {
                found = it->second;
                break;
            }
        }

        if (found < 0) {
            out.push_back(m_unk);
            return;
        }
        pieces.push_back(found);
        start += len;
    }

    out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    std::vector<int64_t> ids{m_cls};
    if (max_len < 2) max_len = 2;

    for (const auto& w : split_words(text)) {
        append_pieces(w, ids);
        if (ids.size() >= max_len - 1) {
            ids.resize(max_len - 1);
            break;
        }
    }

    ids.push_back(m_sep);
    return ids;
}
