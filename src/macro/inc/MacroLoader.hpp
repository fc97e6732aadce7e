#pragma once

#include "MacroCatalog.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

class MacroLoader {
public:
    // Files whose name starts with this prefix are side documents, not macros
    static constexpr const char* kSideDocumentPrefix = "_";

    explicit MacroLoader(std::filesystem::path root);

    // Scan the tree, parse every macro document and expand includes.
    // Per-file failures become LoadErrors; a missing root yields an empty catalog.
    MacroCatalog load() const;

    // Parse and validate a single document. Throws std::runtime_error on any failure.
    static MacroDefinition parse_document(const std::string& yaml_text, const std::string& fallback_name);
    static MacroDefinition parse_node(const YAML::Node& document, const std::string& fallback_name);

    // Empty unless the document is a mapping with `kind: knowledge-base`
    static std::optional<KnowledgeBase> parse_knowledge_base(const YAML::Node& document,
                                                             const std::string& product_name,
                                                             const std::string& file_path);

    // "sub/dir/name" for root/sub/dir/name.yaml
    static std::string canonical_name(const std::filesystem::path& root, const std::filesystem::path& file);

    static bool is_macro_file(const std::filesystem::path& file);
    static bool is_side_document(const std::filesystem::path& file);

    const std::filesystem::path& root() const { return root_; }

private:
    void load_side_document(const std::filesystem::path& file, MacroCatalog& catalog) const;

    std::filesystem::path root_;
};
