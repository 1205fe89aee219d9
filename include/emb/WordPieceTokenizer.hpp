#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

// Model inputs for a single sequence; all three have the same length.
struct TokenEncoding {
    std::vector<int64_t> input_ids;
    std::vector<int64_t> attention_mask;
    std::vector<int64_t> token_type_ids;

    size_t size() const { return input_ids.size(); }
};

class WordPieceTokenizer {
public:
    // One token per line, line number = id. Fails if [CLS]/[SEP]/[UNK] are missing.
    bool load_vocab(const std::string& vocab_path);
    bool load_vocab(std::istream& in);

    // [CLS] pieces... [SEP], truncated to max_len (at least 2)
    TokenEncoding encode(const std::string& text, size_t max_len) const;

    std::vector<std::string> tokenize(const std::string& text) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }

    int64_t unk_id() const { return id_or(-1, "[UNK]"); }
    int64_t cls_id() const { return id_or(-1, "[CLS]"); }
    int64_t sep_id() const { return id_or(-1, "[SEP]"); }

private:
    static constexpr size_t kMaxCharsPerWord = 100;  // UTF-8 code points

    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    static bool is_ws(char c);
    static bool is_punct(char c);

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    void wordpiece(const std::string& word, std::vector<std::string>& out) const;

    int64_t id_or(int64_t def, const std::string& tok) const;
};
