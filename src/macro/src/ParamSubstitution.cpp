#include "ParamSubstitution.hpp"
#include "StringUtils.hpp"
#include <cctype>

namespace ParamSubstitution {

namespace {

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

template <typename Lookup>
std::string scan(const std::string& text, Lookup lookup) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);

        size_t end = open + 2;
        while (end < text.size() && is_token_char(text[end])) ++end;

        if (end > open + 2 && text.compare(end, 2, "}}") == 0) {
            const std::string name = text.substr(open + 2, end - open - 2);
            if (const std::string* value = lookup(name)) {
                out += *value;
            } else {
                out.append(text, open, end + 2 - open);
            }
            pos = end + 2;
        } else {
            // Not a token here; resume one character later so "{{{x}}" still matches
            out += text[open];
            pos = open + 1;
        }
    }
    return out;
}

void rewrite(std::string& s, const StringTransform& fn) {
    s = fn(s);
}

void rewrite(std::optional<std::string>& s, const StringTransform& fn) {
    if (s) *s = fn(*s);
}

void rewrite(ElementCriteria& c, const StringTransform& fn) {
    rewrite(c.automation_id, fn);
    rewrite(c.name, fn);
    rewrite(c.class_name, fn);
    rewrite(c.control_type, fn);
}

void rewrite(ParamMap& params, const StringTransform& fn) {
    for (auto& [key, value] : params) {
        value = fn(value);
    }
}

struct TransformVisitor {
    const StringTransform& fn;

    void operator()(FocusStep&) const {}
    void operator()(AttachStep& s) const { rewrite(s.process_name, fn); }
    void operator()(SnapshotStep&) const {}
    void operator()(FindStep& s) const { rewrite(s.criteria, fn); rewrite(s.save_as, fn); }
    void operator()(FindByPathStep& s) const {
        for (auto& segment : s.path) rewrite(segment, fn);
        rewrite(s.save_as, fn);
    }
    void operator()(ClickStep& s) const { rewrite(s.ref, fn); }
    void operator()(RightClickStep& s) const { rewrite(s.ref, fn); }
    void operator()(TypeStep& s) const { rewrite(s.text, fn); }
    void operator()(SetValueStep& s) const { rewrite(s.ref, fn); rewrite(s.value, fn); }
    void operator()(GetValueStep& s) const { rewrite(s.ref, fn); }
    void operator()(SendKeysStep& s) const { rewrite(s.keys, fn); }
    void operator()(WaitStep&) const {}
    void operator()(WaitForEnabledStep& s) const { rewrite(s.criteria, fn); rewrite(s.ref, fn); rewrite(s.save_as, fn); }
    void operator()(MacroCallStep& s) const { rewrite(s.macro_name, fn); rewrite(s.params, fn); }
    void operator()(IncludeStep& s) const { rewrite(s.macro_name, fn); rewrite(s.params, fn); }
    void operator()(LaunchStep& s) const {
        rewrite(s.exe_path, fn);
        rewrite(s.arguments, fn);
        rewrite(s.working_directory, fn);
    }
    void operator()(WaitForWindowStep& s) const { rewrite(s.title_contains, fn); rewrite(s.criteria, fn); }
    void operator()(ScreenshotStep&) const {}
    void operator()(PropertiesStep& s) const { rewrite(s.ref, fn); }
    void operator()(ChildrenStep& s) const { rewrite(s.ref, fn); rewrite(s.save_as, fn); }
    void operator()(FileDialogStep& s) const { rewrite(s.text, fn); }
    void operator()(VerifyStep& s) const {
        rewrite(s.ref, fn);
        rewrite(s.property, fn);
        rewrite(s.expected, fn);
        rewrite(s.match_mode, fn);
        rewrite(s.message, fn);
    }
};

}

std::string substitute(const std::string& text, const ParamMap& params) {
    if (params.empty()) return text;
    return scan(text, [&params](const std::string& name) -> const std::string* {
        auto it = params.find(name);
        return it == params.end() ? nullptr : &it->second;
    });
}

std::optional<std::string> substitute(const std::optional<std::string>& text, const ParamMap& params) {
    if (!text) return std::nullopt;
    return substitute(*text, params);
}

std::string remap(const std::string& text, const ParamMap& mapping) {
    if (mapping.empty()) return text;
    return scan(text, [&mapping](const std::string& name) -> const std::string* {
        for (const auto& [key, value] : mapping) {
            if (StringUtils::iequals(key, name)) return &value;
        }
        return nullptr;
    });
}

void transform_strings(MacroStep& step, const StringTransform& fn) {
    std::visit(TransformVisitor{fn}, step.action);
    rewrite(step.description, fn);
}

}
