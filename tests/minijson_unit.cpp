#include <iostream>
#include <string>
#include "net/MiniJson.h"

using namespace net;

int main() {

    auto e1 = json_escape("abc");
    if (e1 != "abc") { std::cerr << "json_escape changed plain text: " << e1 << "\n"; return 1; }
    auto e2 = json_escape("a\"b");
    if (e2 != "a\\\"b") { std::cerr << "json_escape did not escape quote\n"; return 1; }
    auto e3 = json_escape("a\\b");
    if (e3 != "a\\\\b") { std::cerr << "json_escape did not escape backslash\n"; return 1; }
    auto e4 = json_escape("\n\t\r");
    if (e4 != "\\n\\t\\r") { std::cerr << "json_escape did not escape control chars: " << e4 << "\n"; return 1; }
    auto e5 = json_escape(std::string("\x01", 1));
    if (e5 != "\\u0001") { std::cerr << "json_escape did not escape raw control byte: " << e5 << "\n"; return 1; }
    auto e6 = json_escape("привет");
    if (e6 != "привет") { std::cerr << "json_escape altered utf-8\n"; return 1; }

    // tree access
    {
        auto v = json_parse("{\"a\":\"b\",\"n\":42,\"t\":true,\"z\":null,\"arr\":[1,\"x\"],\"o\":{}}");
        if (!v.is_object() || v.size() != 6) { std::cerr << "object size mismatch\n"; return 1; }
        if (v.find("a")->as_string() != "b") { std::cerr << "string member wrong\n"; return 1; }
        if (v.find("n")->number_text() != "42") { std::cerr << "number text wrong\n"; return 1; }
        if (!v.find("t")->as_bool()) { std::cerr << "bool member wrong\n"; return 1; }
        if (!v.find("z")->is_null()) { std::cerr << "null member wrong\n"; return 1; }
        if (v.find("arr")->as_array().size() != 2) { std::cerr << "array size wrong\n"; return 1; }
        if (!v.find("o")->is_object() || v.find("o")->size() != 0) { std::cerr << "empty object wrong\n"; return 1; }
        if (v.find("missing") != nullptr) { std::cerr << "find returned absent key\n"; return 1; }
        if (json_get_string(v, "n").has_value()) { std::cerr << "json_get_string accepted number\n"; return 1; }
    }

    // wrong-type access throws
    {
        auto v = json_parse("{\"a\":1}");
        bool threw = false;
        try { (void)v.find("a")->as_string(); } catch (const std::runtime_error&) { threw = true; }
        if (!threw) { std::cerr << "as_string on number did not throw\n"; return 1; }
    }

    // compact and pretty output keep member order and null vs {}
    {
        auto obj = JsonValue::object();
        obj.set("production", JsonValue::object());
        obj.set("preview", JsonValue::null());
        auto compact = json_dump(obj);
        if (compact != "{\"production\":{},\"preview\":null}") { std::cerr << "compact dump wrong: " << compact << "\n"; return 1; }
        auto pretty = json_dump(obj, 2);
        if (pretty != "{\n  \"production\": {},\n  \"preview\": null\n}") { std::cerr << "pretty dump wrong: " << pretty << "\n"; return 1; }
    }

    // set() replaces an existing key
    {
        auto obj = JsonValue::object();
        obj.set("k", JsonValue::string("1"));
        obj.set("k", JsonValue::string("2"));
        if (obj.size() != 1 || obj.find("k")->as_string() != "2") { std::cerr << "set did not replace\n"; return 1; }
    }

    // unicode escapes
    {
        auto v = json_parse("\"\\u00e9\\ud83d\\ude00\"");
        if (v.as_string() != "\xc3\xa9\xf0\x9f\x98\x80") { std::cerr << "unicode escape decode wrong\n"; return 1; }
    }

    std::cout << "minijson_unit ok\n";
    return 0;
}
