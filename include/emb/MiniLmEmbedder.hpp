#pragma once
#include "emb/TextEmbedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

// Sentence embeddings from an exported all-MiniLM ONNX model: mean pooling over the
// last hidden state, then L2 normalization.
class MiniLmEmbedder final : public TextEmbedder {
public:
    // throws std::runtime_error when the vocab or the model cannot be loaded
    MiniLmEmbedder(const std::string& model_path, const std::string& vocab_path, size_t max_len = 128);

    std::vector<float> embed(const std::string& text) const override;

private:
    WordPieceTokenizer m_tok;
    size_t m_max_len;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "skillpath"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::vector<std::string> m_input_names;
    std::string m_output_name;
};
