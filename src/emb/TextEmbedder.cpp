#include "emb/TextEmbedder.hpp"
#include <cctype>

static bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::vector<float>> TextEmbedder::embed_all(const std::vector<std::string>& texts) const {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) {
        if (is_blank(t)) out.emplace_back();
        else out.push_back(embed(t));
    }
    return out;
}
