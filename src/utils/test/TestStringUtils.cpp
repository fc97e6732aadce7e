#include "StringUtils.hpp"
#include <cassert>
#include <iostream>
#include <map>
#include <stdexcept>

void test_case_insensitive_helpers() {
    assert(StringUtils::iequals("Save", "SAVE"));
    assert(!StringUtils::iequals("Save", "Saved"));
    assert(StringUtils::icontains("Untitled - Notepad", "notepad"));
    assert(StringUtils::icontains("anything", ""));
    assert(!StringUtils::icontains("Notepad", "Word"));
    assert(StringUtils::istarts_with("Document1.docx", "document"));
    assert(!StringUtils::istarts_with("Doc", "Document"));
    assert(StringUtils::iends_with("login.YAML", ".yaml"));
    assert(!StringUtils::iends_with("yaml", "login.yaml"));
    std::cout << "test_case_insensitive_helpers passed" << std::endl;
}

void test_trim_and_lower() {
    std::string s = "  \tOpen File \n";
    StringUtils::trim(s);
    assert(s == "Open File");
    assert(StringUtils::trimmed("   ") == "");
    assert(StringUtils::to_lower("Send_Keys") == "send_keys");
    std::cout << "test_trim_and_lower passed" << std::endl;
}

void test_join() {
    assert(StringUtils::join({"a", "b", "c"}, ", ") == "a, b, c");
    assert(StringUtils::join({}, ", ") == "");
    assert(StringUtils::join({"only"}, " -> ") == "only");
    std::cout << "test_join passed" << std::endl;
}

void test_base64() {
    std::vector<uint8_t> png_header = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    assert(StringUtils::base64_encode(png_header) == "iVBORw0KGgo=");
    assert(StringUtils::base64_decode("iVBORw0KGgo=") == png_header);
    assert(StringUtils::base64_encode({'M', 'a'}) == "TWE=");
    assert(StringUtils::base64_encode({}) == "");

    bool thrown = false;
    try {
        StringUtils::base64_decode("ab*d");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    (void)thrown;
    assert(thrown);
    std::cout << "test_base64 passed" << std::endl;
}

void test_case_insensitive_map() {
    std::map<std::string, int, CaseInsensitiveLess> table;
    table["Folder/Login"] = 1;
    assert(table.count("folder/login") == 1);
    assert(table.count("FOLDER/LOGIN") == 1);
    table["folder/LOGIN"] = 2;
    assert(table.size() == 1);
    assert(table.begin()->first == "Folder/Login");
    std::cout << "test_case_insensitive_map passed" << std::endl;
}

int main() {
    test_case_insensitive_helpers();
    test_trim_and_lower();
    test_join();
    test_base64();
    test_case_insensitive_map();
    std::cout << "All StringUtils tests passed!" << std::endl;
    return 0;
}
