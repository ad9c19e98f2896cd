#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// BERT-style uncased WordPiece encoder over a vocab.txt (one token per line, id = line number).
class WordPieceTokenizer {
public:
    // throws std::runtime_error if the file is missing, empty, or lacks [CLS]/[SEP]/[UNK]
    void load_vocab(const std::string& vocab_path);

    // [CLS] pieces... [SEP], never longer than max_len
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    size_t vocab_size() const { return m_tokens.size(); }

private:
    std::unordered_map<std::string, int64_t> m_ids;
    std::vector<std::string> m_tokens;
    int64_t m_cls = -1;
    int64_t m_sep = -1;
    int64_t m_unk = -1;

    // whitespace split, punctuation emitted as single-char words, ASCII lowercased
    static std::vector<std::string> split_words(const std::string& text);

    // greedy longest-prefix pieces; appends m_unk alone when any part is unknown
    void append_pieces(const std::string& word, std::vector<int64_t>& out) const;
};
