#include "IncludeExpander.hpp"
#include "ParamSubstitution.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <stdexcept>

IncludeExpander::IncludeExpander(const MacroTable& macros) : macros_(macros), less_(macros.key_comp()) {}

std::vector<MacroStep> IncludeExpander::expand(const std::string& name) {
    std::vector<std::string> path;
    return expand_macro(name, path);
}

std::vector<MacroStep> IncludeExpander::expand_steps(const std::vector<MacroStep>& steps) {
    std::vector<std::string> path;
    return expand_steps(steps, path);
}

std::vector<MacroStep> IncludeExpander::expand_macro(const std::string& name, std::vector<std::string>& path) {
    auto memo = expanded_.find(name);
    if (memo != expanded_.end()) {
        return memo->second;
    }

    auto it = macros_.find(name);
    if (it == macros_.end()) {
        throw std::runtime_error("include references unknown macro '" + name + "'");
    }

    path.push_back(it->first);
    std::vector<MacroStep> steps = expand_steps(it->second.steps, path);
    path.pop_back();

    expanded_.emplace(it->first, steps);
    return steps;
}

std::vector<MacroStep> IncludeExpander::expand_steps(const std::vector<MacroStep>& steps,
                                                     std::vector<std::string>& path) {
    std::vector<MacroStep> result;
    result.reserve(steps.size());

    for (const auto& step : steps) {
        const auto* include = std::get_if<IncludeStep>(&step.action);
        if (!include) {
            result.push_back(step);
            continue;
        }

        if (include->macro_name.empty()) {
            throw std::runtime_error("include step is missing 'macro_name' field");
        }

        auto target = macros_.find(include->macro_name);
        if (target == macros_.end()) {
            throw std::runtime_error("include references unknown macro '" + include->macro_name + "'");
        }

        const bool on_path = std::any_of(path.begin(), path.end(), [this, &target](const std::string& p) {
            return !less_(p, target->first) && !less_(target->first, p);
        });
        if (on_path) {
            std::vector<std::string> cycle = path;
            cycle.push_back(target->first);
            throw std::runtime_error("Circular include detected: " + StringUtils::join(cycle, " -> "));
        }

        std::vector<MacroStep> child = expand_macro(target->first, path);
        for (auto& cloned : child) {
            if (!include->params.empty()) {
                const ParamMap& mapping = include->params;
                ParamSubstitution::transform_strings(cloned, [&mapping](const std::string& s) {
                    return ParamSubstitution::remap(s, mapping);
                });
            }
            result.push_back(std::move(cloned));
        }
    }
    return result;
}

void expand_all_includes(MacroTable& macros,
                         const std::map<std::string, std::string, CaseInsensitiveLess>& sources,
                         std::vector<LoadError>& errors) {
    std::map<std::string, std::vector<MacroStep>, CaseInsensitiveLess> expanded;
    std::vector<std::string> failed;

    {
        IncludeExpander expander(macros);
        for (const auto& [name, definition] : macros) {
            if (!definition.has_includes()) continue;

            try {
                expanded[name] = expander.expand(name);
            } catch (const std::exception& e) {
                auto source = sources.find(name);
                errors.push_back(LoadError{
                    source == sources.end() ? std::string() : source->second,
                    name,
                    e.what()
                });
                LogUtils::warn("Include expansion failed for macro '{}': {}", name, e.what());
                failed.push_back(name);
            }
        }
    }

    for (auto& [name, steps] : expanded) {
        macros[name].steps = std::move(steps);
    }
    for (const auto& name : failed) {
        macros.erase(name);
    }
}
