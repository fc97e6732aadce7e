#pragma once

#include "MacroDefinition.hpp"
#include "StringUtils.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct MacroSummary {
    std::string key;            // Name used to run the macro
    std::string name;           // Display name from the document
    std::string description;
    std::vector<ParameterSpec> parameters;
    size_t step_count = 0;
};

// A `kind: knowledge-base` side document describing the application a
// product folder automates
struct KnowledgeBase {
    std::string product_name;   // Folder relative to the macros root, "default" at the root
    std::string file_path;
    std::string process_name;   // application.process_name, may be empty
    std::string summary;
    std::string content;        // The document re-emitted as YAML
};

using MacroTable = std::map<std::string, MacroDefinition, CaseInsensitiveLess>;

// One published load pass: every macro that loaded cleanly plus the errors of
// those that did not. Never mutated once published.
struct MacroCatalog {
    MacroTable macros;
    std::vector<LoadError> errors;
    std::map<std::string, KnowledgeBase, CaseInsensitiveLess> knowledge_bases;

    const MacroDefinition* find(const std::string& name) const {
        auto it = macros.find(name);
        return it == macros.end() ? nullptr : &it->second;
    }

    // Product folder whose knowledge base names this process
    std::optional<std::string> product_for_process(const std::string& process_name) const {
        for (const auto& [product, kb] : knowledge_bases) {
            if (!kb.process_name.empty() && StringUtils::iequals(kb.process_name, process_name)) {
                return product;
            }
        }
        return std::nullopt;
    }
};
