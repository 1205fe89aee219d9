#pragma once
#include <string>

int recordsDump(const std::string& dataPath);
