#pragma once
#include <string>
#include <vector>

// Maps text to a fixed-size, L2-normalized vector. Empty result = could not embed.
class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;
    virtual std::vector<float> embed(const std::string& text) const = 0;
};
