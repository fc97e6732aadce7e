#pragma once

#include "MacroCatalog.hpp"
#include <string>
#include <vector>

// Flattens include steps by splicing in the referenced macro's steps. Each
// include's params rewrite the child's {{placeholders}} in the spliced copies.
// Cycles are detected per DFS path, so the same macro may be included from
// several branches.
class IncludeExpander {
public:
    explicit IncludeExpander(const MacroTable& macros);

    // Steps of the named macro with every include resolved.
    // Throws std::runtime_error on a missing target, a missing macro_name or a cycle.
    std::vector<MacroStep> expand(const std::string& name);

    // Resolve includes in a free-standing step list, e.g. an inline document
    std::vector<MacroStep> expand_steps(const std::vector<MacroStep>& steps);

private:
    std::vector<MacroStep> expand_macro(const std::string& name, std::vector<std::string>& path);
    std::vector<MacroStep> expand_steps(const std::vector<MacroStep>& steps, std::vector<std::string>& path);

    const MacroTable& macros_;
    MacroTable::key_compare less_;
    std::map<std::string, std::vector<MacroStep>, CaseInsensitiveLess> expanded_;
};

// Expand every macro in the table in place. A macro whose expansion fails is
// removed and a LoadError naming its source file is appended.
void expand_all_includes(MacroTable& macros,
                         const std::map<std::string, std::string, CaseInsensitiveLess>& sources,
                         std::vector<LoadError>& errors);
