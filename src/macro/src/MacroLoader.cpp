#include "MacroLoader.hpp"
#include "IncludeExpander.hpp"
#include "MacroParser.hpp"
#include "StepValidator.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

MacroLoader::MacroLoader(fs::path root) : root_(std::move(root)) {}

bool MacroLoader::is_macro_file(const fs::path& file) {
    const std::string ext = file.extension().string();
    return StringUtils::iequals(ext, ".yaml") || StringUtils::iequals(ext, ".yml");
}

bool MacroLoader::is_side_document(const fs::path& file) {
    return file.filename().string().rfind(kSideDocumentPrefix, 0) == 0;
}

std::string MacroLoader::canonical_name(const fs::path& root, const fs::path& file) {
    fs::path relative = file.lexically_relative(root);
    if (relative.empty()) {
        relative = file.filename();
    }
    relative.replace_extension();
    return relative.generic_string();
}

MacroDefinition MacroLoader::parse_node(const YAML::Node& document, const std::string& fallback_name) {
    if (!document || document.IsNull() || !document.IsMap()) {
        throw std::runtime_error("Document is empty or not a mapping");
    }

    const YAML::Node steps = document["steps"];
    if (!steps || steps.IsNull() || (steps.IsSequence() && steps.size() == 0)) {
        throw std::runtime_error("Macro has no steps defined");
    }

    if (auto error = StepValidator::validate(steps)) {
        throw std::runtime_error(*error);
    }

    MacroDefinition definition = document.as<MacroDefinition>();
    if (definition.name.empty()) {
        definition.name = fallback_name;
    }
    return definition;
}

MacroDefinition MacroLoader::parse_document(const std::string& yaml_text, const std::string& fallback_name) {
    YAML::Node document;
    try {
        document = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
    }
    return parse_node(document, fallback_name);
}

namespace {

std::string scalar_or(const YAML::Node& node, const char* key, const std::string& fallback = "") {
    const YAML::Node value = node[key];
    return value && value.IsScalar() ? value.Scalar() : fallback;
}

// "key (action), ..." for a list of {key, action} entries
std::string shortcut_list(const YAML::Node& entries) {
    std::vector<std::string> parts;
    for (const auto& entry : entries) {
        if (!entry.IsMap()) continue;
        const std::string key = scalar_or(entry, "key");
        if (!key.empty()) parts.push_back(key + " (" + scalar_or(entry, "action") + ")");
    }
    return StringUtils::join(parts, ", ");
}

std::string knowledge_summary(const YAML::Node& document, const std::string& product_name) {
    std::vector<std::string> lines{"  " + product_name + ":"};

    const YAML::Node app = document["application"];
    if (app && app.IsMap()) {
        lines.push_back("    Application: " +
                        StringUtils::trimmed(scalar_or(app, "name", "Unknown") + " " + scalar_or(app, "version")));
        const std::string exe = scalar_or(app, "exe_path");
        if (!exe.empty()) lines.push_back("    Exe Path: " + exe);
    }

    const YAML::Node shortcuts = document["keyboard_shortcuts"];
    if (shortcuts && shortcuts.IsSequence()) {
        const std::string list = shortcut_list(shortcuts);
        if (!list.empty()) lines.push_back("    Keyboard Shortcuts: " + list);
    }

    const YAML::Node tips = document["navigation_tips"];
    if (tips && tips.IsSequence()) {
        lines.push_back("    Navigation Tips: " + std::to_string(tips.size()) + " tips available");
    }

    const YAML::Node workflows = document["workflows"];
    if (workflows && workflows.IsMap()) {
        lines.push_back("    Workflows: " + std::to_string(workflows.size()) + " documented workflows");
    }
    return StringUtils::join(lines, "\n");
}

}

std::optional<KnowledgeBase> MacroLoader::parse_knowledge_base(const YAML::Node& document,
                                                               const std::string& product_name,
                                                               const std::string& file_path) {
    if (!document || !document.IsMap() || scalar_or(document, "kind") != "knowledge-base") {
        return std::nullopt;
    }

    KnowledgeBase kb;
    kb.product_name = product_name;
    kb.file_path = file_path;
    const YAML::Node app = document["application"];
    if (app && app.IsMap()) kb.process_name = scalar_or(app, "process_name");
    kb.summary = knowledge_summary(document, product_name);
    kb.content = YAML::Dump(document);
    return kb;
}

void MacroLoader::load_side_document(const fs::path& file, MacroCatalog& catalog) const {
    std::string product = file.parent_path().lexically_relative(root_).generic_string();
    if (product.empty() || product == ".") product = "default";

    try {
        auto kb = parse_knowledge_base(YAML::LoadFile(file.string()), product, file.string());
        if (!kb) {
            LogUtils::debug("Skipping side document {}", file.string());
            return;
        }
        catalog.knowledge_bases[product] = std::move(*kb);
    } catch (const YAML::Exception& e) {
        LogUtils::warn("Failed to load knowledge base {}: {}", file.string(), e.what());
    }
}

MacroCatalog MacroLoader::load() const {
    MacroCatalog catalog;
    std::map<std::string, std::string, CaseInsensitiveLess> sources;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        LogUtils::warn("Macros directory not found: {}", root_.string());
        return catalog;
    }

    std::vector<fs::path> files;
    for (auto it = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec) || !is_macro_file(it->path())) continue;
        if (is_side_document(it->path())) {
            load_side_document(it->path(), catalog);
            continue;
        }
        files.push_back(it->path());
    }
    if (ec) {
        LogUtils::warn("Error while scanning {}: {}", root_.string(), ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        const std::string name = canonical_name(root_, file);
        try {
            if (sources.count(name)) {
                throw std::runtime_error("Duplicate macro name '" + name + "' (already defined by " +
                                         sources[name] + ")");
            }

            YAML::Node document;
            try {
                document = YAML::LoadFile(file.string());
            } catch (const YAML::Exception& e) {
                throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
            }

            catalog.macros.emplace(name, parse_node(document, name));
            sources.emplace(name, file.string());
        } catch (const std::exception& e) {
            LogUtils::warn("Failed to load macro {}: {}", file.string(), e.what());
            catalog.errors.push_back(LoadError{file.string(), name, e.what()});
        }
    }

    expand_all_includes(catalog.macros, sources, catalog.errors);

    LogUtils::info("Loaded {} macros and {} knowledge bases from {} ({} load errors)",
                   catalog.macros.size(), catalog.knowledge_bases.size(), root_.string(), catalog.errors.size());
    return catalog;
}
