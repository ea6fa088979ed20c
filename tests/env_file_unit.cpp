#include <iostream>
#include <string>
#include <vector>
#include "envvars/EnvFile.h"
#include "errors/Errors.h"

using namespace envvars;

int main() {

    // production available, preview null
    VariableDocument doc = parse_document("{\"production\":{\"A\":\"1\"},\"preview\":null}");
    {
        auto lines = to_env_lines(doc, Environment::Production);
        if (lines.size() != 1 || lines[0] != "A=1") { std::cerr << "expected single line A=1\n"; return 1; }
    }
    {
        bool unavailable = false;
        try {
            to_env_lines(doc, Environment::Preview);
        } catch (const errors::EnvironmentUnavailable& e) {
            unavailable = e.environment() == "preview";
        }
        if (!unavailable) { std::cerr << "null preview did not raise EnvironmentUnavailable\n"; return 1; }
    }

    // stable sorted order
    {
        VariableDocument unsorted = parse_document("{\"production\":{\"B\":\"2\",\"A\":\"1\"},\"preview\":{}}");
        auto lines = to_env_lines(unsorted, Environment::Production);
        if (lines != std::vector<std::string>{"A=1", "B=2"}) { std::cerr << "lines not sorted by key\n"; return 1; }
        if (join_env_lines(lines) != "A=1\nB=2\n") { std::cerr << "join_env_lines wrong\n"; return 1; }
        if (!to_env_lines(unsorted, Environment::Preview).empty()) { std::cerr << "empty preview produced lines\n"; return 1; }
        if (join_env_lines({}) != "") { std::cerr << "join of no lines not empty\n"; return 1; }
    }

    // escaping rule
    struct Case { const char* in; const char* out; };
    const Case cases[] = {
        {"plain", "plain"},
        {"https://x.dev/a?b=1", "\"https://x.dev/a?b=1\""},
        {"", ""},
        {"two words", "\"two words\""},
        {"line1\nline2", "\"line1\\nline2\""},
        {"say \"hi\"", "\"say \\\"hi\\\"\""},
        {"C:\\path", "\"C:\\\\path\""},
        {"it's", "\"it's\""},
        {"#notcomment", "\"#notcomment\""},
        {"tab\there", "\"tab\\there\""},
        {"$HOME", "$HOME"},
    };
    for (const auto& c : cases) {
        auto got = format_env_value(c.in);
        if (got != c.out) { std::cerr << "format_env_value(" << c.in << ") = " << got << " expected " << c.out << "\n"; return 1; }
    }

    // --empty keeps keys, drops values
    {
        VariableDocument secrets = parse_document("{\"production\":{\"TOKEN\":\"s3cr3t\",\"URL\":\"x\"},\"preview\":null}");
        auto lines = to_env_lines(secrets, Environment::Production, true);
        if (lines != std::vector<std::string>{"TOKEN=", "URL="}) { std::cerr << "empty values mode wrong\n"; return 1; }
    }

    // keys that cannot form a single KEY=VALUE line are refused
    {
        const char* bad_names[] = {"A\nINJECTED", "B=C", "", "WITH SPACE"};
        for (const char* name : bad_names) {
            VariableDocument built;
            built.production = VariableMap{{"OK", "1"}, {name, "x"}};
            bool refused = false;
            try {
                to_env_lines(built, Environment::Production);
            } catch (const errors::MalformedDocument&) {
                refused = true;
            }
            if (!refused) { std::cerr << "variable name '" << name << "' was rendered\n"; return 1; }
        }
    }

    std::cout << "env_file_unit ok\n";
    return 0;
}
