#pragma once
#include <string>
#include <vector>

struct SkillHit {
    std::string skill_id;
    float score;
};

// Dense vectors keyed by skill id, searched by cosine similarity.
class SkillIndex {
public:
    void add(const std::string& skill_id, const std::vector<float>& vec);  // throws on dim mismatch

    std::vector<SkillHit> topk(const std::vector<float>& query_vec, size_t k) const;

    // binary cache: dim, count, ids, packed floats
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    size_t dim() const { return m_dim; }
    size_t size() const { return m_ids.size(); }

private:
    size_t m_dim = 0;
    std::vector<std::string> m_ids;
    std::vector<float> m_vecs; // packed: size = size()*dim()

    static float cosine(const float* a, const float* b, size_t dim);
};
