#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace hierarchy {

struct NodeRecord {
    std::string root_key;
    std::string root_name;
    std::string root_description;     // embedded as the "root" vector
    std::string parent_key;
    std::string parent_name;          // empty = no declared parent
    std::string parent_short_summary; // embedded as the "parent" vector

    bool has_parent() const { return !parent_name.empty(); }
};

// Empty vector = no embedding for that text.
using Embedding = std::vector<float>;

// root[i] / parent[i] belong to records[i]
struct EmbeddingTable {
    std::vector<Embedding> root;
    std::vector<Embedding> parent;

    size_t size() const { return root.size(); }
};

enum class Verdict {
    Valid,
    Invalid
};

struct ParentRef {
    std::string parent_key;
    std::string parent_name;
    float similarity_score = 0.0f;
};

struct SuggestedParent {
    std::string parent_key;
    std::string parent_name;
    float similarity_score = 0.0f;
    float improvement = 0.0f;  // similarity_score - current score
    std::string source_root_key;  // record whose parent-role embedding matched
};

struct ValidationResult {
    std::string root_key;
    std::string root_name;

    ParentRef current_parent;
    std::vector<SuggestedParent> suggested_parents;  // score descending, <= top_n

    Verdict validation = Verdict::Invalid;

    bool valid() const { return validation == Verdict::Valid; }
};

// Non-fatal problem seen during a run (malformed vector etc.)
struct Diagnostic {
    std::string code;
    std::string message;
    std::string root_key;
};

// Dataset-level structural problem; aborts the run.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

const char* verdict_str(Verdict v);         // VALID / INVALID
const char* verdict_status_str(Verdict v);  // PASS / FAIL

}  // namespace hierarchy
