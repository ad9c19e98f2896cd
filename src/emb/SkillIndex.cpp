#include "emb/SkillIndex.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>

void SkillIndex::add(const std::string& skill_id, const std::vector<float>& vec) {
    if (vec.empty()) return;
    if (m_dim == 0) m_dim = vec.size();
    if (vec.size() != m_dim) {
        throw std::runtime_error("SkillIndex: inconsistent embedding dim for " + skill_id);
    }
    m_ids.push_back(skill_id);
    m_vecs.insert(m_vecs.end(), vec.begin(), vec.end());
}

float SkillIndex::cosine(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        dot += (double)a[i] * b[i];
        na += (double)a[i] * a[i];
        nb += (double)b[i] * b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / std::sqrt(na * nb));
}

std::vector<SkillHit> SkillIndex::topk(const std::vector<float>& query_vec, size_t k) const {
    std::vector<SkillHit> hits;
    if (m_dim == 0 || query_vec.size() != m_dim || k == 0) return hits;

    hits.reserve(m_ids.size());
    for (size_t i = 0; i < m_ids.size(); ++i) {
        hits.push_back({m_ids[i], cosine(query_vec.data(), &m_vecs[i * m_dim], m_dim)});
    }

    // ties resolved by id so repeated queries agree
    auto better = [](const SkillHit& a, const SkillHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.skill_id < b.skill_id;
    };
    const size_t keep = std::min(k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + keep, hits.end(), better);
    hits.resize(keep);
    return hits;
}

bool SkillIndex::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;

    const uint32_t dim = (uint32_t)m_dim;
    const uint32_t n = (uint32_t)m_ids.size();
    out.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
    out.write(reinterpret_cast<const char*>(&n), sizeof(n));

    for (const auto& id : m_ids) {
        const uint32_t len = (uint32_t)id.size();
        out.write(reinterpret_cast<const char*>(&len), sizeof(len));
        out.write(id.data(), len);
    }
    out.write(reinterpret_cast<const char*>(m_vecs.data()), (std::streamsize)(sizeof(float) * m_vecs.size()));
    return (bool)out;
}

bool SkillIndex::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    uint32_t dim = 0, n = 0;
    in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
    in.read(reinterpret_cast<char*>(&n), sizeof(n));
    if (!in || dim == 0) return false;

    std::vector<std::string> ids;
    ids.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t len = 0;
        in.read(reinterpret_cast<char*>(&len), sizeof(len));
        if (!in) return false;
        std::string s(len, '\0');
        in.read(&s[0], len);
        if (!in) return false;
        ids.push_back(std::move(s));
    }

    std::vector<float> vecs((size_t)n * dim);
    in.read(reinterpret_cast<char*>(vecs.data()), (std::streamsize)(sizeof(float) * vecs.size()));
    if (!in) return false;

    m_dim = dim;
    m_ids = std::move(ids);
    m_vecs = std::move(vecs);
    return true;
}
