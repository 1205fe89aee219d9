#pragma once
#include <string>
#include <vector>

class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;

    // Empty result = no embedding (blank text or model failure).
    virtual std::vector<float> embed(const std::string& text) const = 0;

    // false until the backing model is loaded
    virtual bool ready() const { return true; }

    std::vector<std::vector<float>> embed_all(const std::vector<std::string>& texts) const;
};
