#include "emb/MiniLmEmbedder.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

MiniLmEmbedder::MiniLmEmbedder(const std::string& model_path, const std::string& vocab_path, size_t max_len)
    : m_max_len(max_len) {
    m_tok.load_vocab(vocab_path);

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        const size_t n_in = m_session->GetInputCount();
        for (size_t i = 0; i < n_in; ++i) {
            m_input_names.push_back(m_session->GetInputNameAllocated(i, allocator).get());
        }
        m_output_name = m_session->GetOutputNameAllocated(0, allocator).get();
    } catch (const Ort::Exception& e) {
        throw std::runtime_error("MiniLmEmbedder: cannot load model " + model_path + ": " + e.what());
    }

    // input_ids, attention_mask and optionally token_type_ids
    if (m_input_names.size() < 2 || m_input_names.size() > 3) {
        throw std::runtime_error("MiniLmEmbedder: unexpected model inputs in " + model_path);
    }
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    std::vector<int64_t> ids = m_tok.encode(text, m_max_len);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);
    const std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()));
    if (m_input_names.size() == 3) {
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
    }

    std::vector<const char*> in_names;
    for (const auto& n : m_input_names) in_names.push_back(n.c_str());
    const char* out_names[1] = { m_output_name.c_str() };

    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, in_names.data(), inputs.data(), inputs.size(), out_names, 1);
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder: inference failed: " << e.what() << "\n";
        return {};
    }

    auto shp = outs[0].GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[1] != (int64_t)seq_len) return {};

    const size_t hidden = (size_t)shp[2];
    const float* data = outs[0].GetTensorData<float>();

    // every position is attended, so the mean is over seq_len rows
    std::vector<float> pooled(hidden, 0.0f);
    for (size_t t = 0; t < seq_len; ++t) {
        const float* row = data + t * hidden;
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }

    double ss = 0.0;
    for (float& x : pooled) {
        x /= (float)seq_len;
        ss += (double)x * x;
    }
    if (ss > 0.0) {
        const float inv = (float)(1.0 / std::sqrt(ss));
        for (float& x : pooled) x *= inv;
    }
    return pooled;
}
