#include "ParamSubstitution.hpp"
#include <cassert>
#include <iostream>

void test_substitutes_known_tokens() {
    ParamMap params = {{"file", "report.txt"}, {"mode", "fast"}};
    assert(ParamSubstitution::substitute("Open {{file}} in {{mode}} mode", params) == "Open report.txt in fast mode");
    assert(ParamSubstitution::substitute("{{file}}{{file}}", params) == "report.txtreport.txt");
    std::cout << "test_substitutes_known_tokens passed" << std::endl;
}

void test_unknown_tokens_unchanged() {
    ParamMap params = {{"a", "1"}, {"b", "2"}};
    const std::string text = "x={{x}} a={{a}} y={{ y }} z={{z}";
    assert(ParamSubstitution::substitute(text, params) == "x={{x}} a=1 y={{ y }} z={{z}");
    assert(ParamSubstitution::substitute(text, {}) == text);
    assert(ParamSubstitution::substitute("{{{a}}}", params) == "{1}");
    std::cout << "test_unknown_tokens_unchanged passed" << std::endl;
}

void test_single_pass_no_recursion() {
    ParamMap params = {{"a", "{{b}}"}, {"b", "deep"}};
    assert(ParamSubstitution::substitute("{{a}}", params) == "{{b}}");
    std::cout << "test_single_pass_no_recursion passed" << std::endl;
}

void test_names_are_case_sensitive() {
    ParamMap params = {{"File", "a.txt"}};
    assert(ParamSubstitution::substitute("{{file}}", params) == "{{file}}");
    assert(ParamSubstitution::remap("{{file}}", params) == "a.txt");
    std::cout << "test_names_are_case_sensitive passed" << std::endl;
}

void test_optional_overload() {
    ParamMap params = {{"n", "5"}};
    assert(!ParamSubstitution::substitute(std::optional<std::string>(), params).has_value());
    assert(ParamSubstitution::substitute(std::optional<std::string>("{{n}}"), params).value() == "5");
    std::cout << "test_optional_overload passed" << std::endl;
}

void test_transform_strings_reaches_every_field() {
    MacroStep find;
    FindStep body;
    body.criteria.name = "{{x}}";
    body.save_as = "{{x}}_ref";
    find.action = body;
    find.description = "find {{x}}";

    MacroStep path;
    path.action = FindByPathStep{{"{{x}}", "child"}, std::nullopt};

    MacroStep call;
    call.action = MacroCallStep{"{{x}}/sub", {{"p", "{{x}}"}}};

    ParamMap mapping = {{"x", "Y"}};
    auto fn = [&mapping](const std::string& s) { return ParamSubstitution::remap(s, mapping); };
    ParamSubstitution::transform_strings(find, fn);
    ParamSubstitution::transform_strings(path, fn);
    ParamSubstitution::transform_strings(call, fn);

    const auto& f = std::get<FindStep>(find.action);
    assert(f.criteria.name.value() == "Y");
    assert(f.save_as.value() == "Y_ref");
    assert(!f.criteria.automation_id.has_value());
    assert(find.description.value() == "find Y");
    assert(std::get<FindByPathStep>(path.action).path[0] == "Y");
    assert(std::get<MacroCallStep>(call.action).macro_name == "Y/sub");
    assert(std::get<MacroCallStep>(call.action).params.at("p") == "Y");
    std::cout << "test_transform_strings_reaches_every_field passed" << std::endl;
}

int main() {
    test_substitutes_known_tokens();
    test_unknown_tokens_unchanged();
    test_single_pass_no_recursion();
    test_names_are_case_sensitive();
    test_optional_overload();
    test_transform_strings_reaches_every_field();
    std::cout << "All ParamSubstitution tests passed!" << std::endl;
    return 0;
}
