// Flat variable table: case-sensitive name -> double.
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include <algorithm>

namespace minibasic {

class VariableTable {
public:
    VariableTable() = default;

    // Create or overwrite a variable. Names are stored exactly as given.
    void set(const std::string& name, double value) {
        table_[name] = value;
    }

    // Try to find an existing variable; returns nullptr if not found.
    const double* tryGet(const std::string& name) const {
        auto it = table_.find(name);
        if (it == table_.end()) return nullptr;
        return &it->second;
    }

    bool contains(const std::string& name) const {
        return table_.find(name) != table_.end();
    }

    bool remove(const std::string& name) {
        return table_.erase(name) > 0;
    }

    void clear() { table_.clear(); }

    size_t size() const { return table_.size(); }
    bool empty() const { return table_.empty(); }

    // Sorted names, for listing and deterministic tests
    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(table_.size());
        for (const auto& kv : table_) out.push_back(kv.first);
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::unordered_map<std::string, double> table_;
};

} // namespace minibasic
