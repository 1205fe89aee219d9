#pragma once
#include "emb/TextEmbedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

// Sentence embedder for all-MiniLM-L6-v2 style ONNX exports.
class MiniLmEmbedder : public TextEmbedder {
public:
    explicit MiniLmEmbedder(size_t max_len = 256) : m_max_len(max_len) {}

    bool init(const std::string& model_path, const std::string& vocab_path);

    // Mean-pooled over the attention mask, L2-normalized
    std::vector<float> embed(const std::string& text) const override;

    bool ready() const override { return m_session != nullptr; }

private:
    size_t m_max_len;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "hierarchy-validator"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    std::string m_out_name;
    size_t m_input_count = 3;
};
