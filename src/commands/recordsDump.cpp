#include "commands/recordsDump.hpp"
#include "io/RecordsIO.hpp"
#include "hierarchy/Models.hpp"

#include <iostream>

static void printField(const char* label, const std::string& value) {
    if (value.empty()) return;
    std::cout << "    " << label << ": " << value << "\n";
}

int recordsDump(const std::string& dataPath) {
    std::vector<hierarchy::NodeRecord> records;
    try {
        records = loadNodeRecords(dataPath);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load dataset: " << e.what() << "\n";
        return 1;
    }

    size_t with_parent = 0;
    for (const auto& r : records) {
        std::cout << "[Node] " << r.root_name << " (" << r.root_key << ")\n";
        if (r.has_parent()) {
            ++with_parent;
            std::cout << "  parent: " << r.parent_name;
            if (!r.parent_key.empty()) std::cout << " (" << r.parent_key << ")";
            std::cout << "\n";
        } else {
            std::cout << "  parent: (none)\n";
        }
        printField("description", r.root_description);
        printField("parent summary", r.parent_short_summary);
        std::cout << "\n";
    }

    std::cout << "RECORDS: " << records.size() << "\n";
    std::cout << "WITH_PARENT: " << with_parent << "\n";
    return 0;
}
