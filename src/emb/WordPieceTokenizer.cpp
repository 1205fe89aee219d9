#include "emb/WordPieceTokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;
    return load_vocab(in);
}

bool WordPieceTokenizer::load_vocab(std::istream& in) {
    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const int64_t id = static_cast<int64_t>(m_id_to_tok.size());
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);  // first occurrence wins
    }

    return cls_id() >= 0 && sep_id() >= 0 && unk_id() >= 0;
}

int64_t WordPieceTokenizer::id_or(int64_t def, const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? def : it->second;
}

bool WordPieceTokenizer::is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool WordPieceTokenizer::is_punct(char c) {
    const unsigned char uc = static_cast<unsigned char>(c);
    return ((uc >= 33 && uc <= 47) || (uc >= 58 && uc <= 64) ||
            (uc >= 91 && uc <= 96) || (uc >= 123 && uc <= 126));
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> words;
    std::string cur;

    auto flush = [&]() {
        if (!cur.empty()) {
            words.push_back(cur);
            cur.clear();
        }
    };

    for (char c : text) {
        if (is_ws(c)) {
            flush();
        } else if (is_punct(c)) {
            flush();
            words.emplace_back(1, c);
        } else {
            // bytes >= 0x80 pass through untouched (uncased ASCII only)
            cur.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    flush();
    return words;
}

static bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Code points, not bytes; continuation bytes are not counted.
static size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if (!is_utf8_continuation(c)) ++n;
    }
    return n;
}

// Greedy longest-match-first. A word with any unmatched span becomes a single [UNK].
void WordPieceTokenizer::wordpiece(const std::string& word, std::vector<std::string>& out) const {
    if (utf8_length(word) > kMaxCharsPerWord) {
        out.emplace_back("[UNK]");
        return;
    }

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        std::string match;

        for (; end > start; --end) {
            if (end < word.size() && is_utf8_continuation(word[end])) continue;
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub.insert(0, "##");
            if (m_tok_to_id.count(sub)) {
                match = std::move(sub);
                break;
            }
        }

        if (match.empty()) {
            out.emplace_back("[UNK]");
            return;
        }
        pieces.push_back(std::move(match));
        start = end;
    }

    out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<std::string> WordPieceTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> out;
    for (const auto& w : basic_tokenize(text)) wordpiece(w, out);
    return out;
}

TokenEncoding WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    if (max_len < 2) max_len = 2;

    const int64_t unk = unk_id();
    const std::vector<std::string> pieces = tokenize(text);

    TokenEncoding enc;
    enc.input_ids.reserve(std::min(max_len, pieces.size() + 2));
    enc.input_ids.push_back(cls_id());

    for (const auto& p : pieces) {
        if (enc.input_ids.size() + 1 >= max_len) break;  // room for [SEP]
        enc.input_ids.push_back(id_or(unk, p));
    }
    enc.input_ids.push_back(sep_id());

    enc.attention_mask.assign(enc.input_ids.size(), 1);
    enc.token_type_ids.assign(enc.input_ids.size(), 0);
    return enc;
}
