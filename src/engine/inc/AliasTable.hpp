#pragma once

#include "StringUtils.hpp"
#include <map>
#include <optional>
#include <string>

// save_as names bound to element reference keys for one macro invocation
class AliasTable {
public:
    void bind(const std::string& alias, const std::string& ref) {
        aliases_[alias] = ref;
    }

    // The bound reference, or the name itself when no alias matches
    std::string resolve(const std::string& name) const {
        auto it = aliases_.find(name);
        return it == aliases_.end() ? name : it->second;
    }

    std::optional<std::string> resolve(const std::optional<std::string>& name) const {
        if (!name || name->empty()) return std::nullopt;
        return resolve(*name);
    }

    bool contains(const std::string& alias) const { return aliases_.count(alias) > 0; }
    size_t size() const { return aliases_.size(); }

private:
    std::map<std::string, std::string, CaseInsensitiveLess> aliases_;
};
