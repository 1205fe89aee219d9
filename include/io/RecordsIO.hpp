#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hierarchy/Models.hpp"

// Dataset: JSON array of objects. Absent/null fields read as "", numbers and
// booleans as their JSON text. Throws hierarchy::InputError on structural problems.
std::vector<hierarchy::NodeRecord> loadNodeRecords(const std::string& path);

std::vector<hierarchy::NodeRecord> parseNodeRecords(const nlohmann::json& j, const std::string& where);
