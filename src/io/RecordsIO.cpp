#include "io/RecordsIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using hierarchy::InputError;
using hierarchy::NodeRecord;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw InputError(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw InputError(where + " must be a JSON array of records");
    }
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number() || it->is_boolean()) return it->dump();
    throw InputError(where + "." + std::string(key) + " must be a string");
}

static NodeRecord parseNodeRecord(const json& j, const std::string& where) {
    require_object(j, where);

    NodeRecord r;
    r.root_key             = optional_string(j, "root_key", where);
    r.root_name            = optional_string(j, "root_name", where);
    r.root_description     = optional_string(j, "root_description", where);
    r.parent_name          = optional_string(j, "parent_name", where);
    r.parent_short_summary = optional_string(j, "parent_short_summary", where);

    // some exports misspell the key as "parnet_key"
    r.parent_key = optional_string(j, "parent_key", where);
    if (r.parent_key.empty()) r.parent_key = optional_string(j, "parnet_key", where);

    return r;
}

std::vector<NodeRecord> parseNodeRecords(const json& j, const std::string& where) {
    require_array(j, where);

    std::vector<NodeRecord> out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        out.push_back(parseNodeRecord(j.at(i), oss.str()));
    }
    return out;
}

std::vector<NodeRecord> loadNodeRecords(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InputError("failed to open dataset file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw InputError("failed to parse JSON in " + path + ": " + e.what());
    }

    return parseNodeRecords(j, path);
}
