#include "LanguageRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace code_agent {

namespace {

std::vector<ToolSpec> python_tools() {
    return {
        {"pylint",
         {"pylint", "--disable=all", "--enable=E,W,F",
          "--msg-template={path}:{line}: [{category}] {msg_id} {msg}", "/code/code.py"},
         EscalationKind::Keywords, {"error", "warning", "fatal"}},
        {"flake8",
         {"flake8", "--max-line-length=120",
          "--format=%(path)s:%(row)d: warning %(code)s %(text)s", "/code/code.py"},
         EscalationKind::Keywords, {"warning"}},
        {"bandit", {"bandit", "-q", "-r", "/code"},
         EscalationKind::Keywords, {">> issue:"}},
        {"black", {"black", "--check", "/code/code.py"},
         EscalationKind::Keywords, {"would reformat", "error"}},
    };
}

std::vector<ToolSpec> javascript_tools() {
    return {
        {"node-check", {"node", "--check", "/code/code.js"},
         EscalationKind::Keywords, {"error", "exception"}},
    };
}

std::vector<ToolSpec> java_tools() {
    return {
        {"javac", {"javac", "-Xlint:all", "-d", "/tmp/out", "/code/Main.java"},
         EscalationKind::Keywords, {"error", "warning"}},
    };
}

std::vector<ToolSpec> c_tools() {
    return {
        {"cppcheck",
         {"cppcheck", "--enable=all", "--suppress=missingIncludeSystem",
          "--template=gcc", "--quiet", "/code/code.c"},
         EscalationKind::Keywords, {"error", "warning"}},
        {"gcc", {"gcc", "-Wall", "-Wextra", "-fsyntax-only", "/code/code.c"},
         EscalationKind::Keywords, {"error", "warning"}},
    };
}

std::vector<ToolSpec> cpp_tools() {
    return {
        {"cppcheck",
         {"cppcheck", "--enable=all", "--suppress=missingIncludeSystem",
          "--template=gcc", "--quiet", "/code/code.cpp"},
         EscalationKind::Keywords, {"error", "warning"}},
        {"g++", {"g++", "-Wall", "-Wextra", "/code/code.cpp", "-o", "/tmp/a.out"},
         EscalationKind::Keywords, {"error", "warning"}},
    };
}

std::vector<ToolSpec> go_tools() {
    return {
        {"govet", {"go", "vet", "/code/code.go"}, EscalationKind::AnyOutput, {}},
        {"gobuild", {"go", "build", "-o", "/tmp/program", "/code/code.go"},
         EscalationKind::AnyOutput, {}},
    };
}

std::array<LanguageSpec, kLanguageCount> build_registry() {
    return {{
        {Language::Python, "python", {"python", "py", "python3"}, "code.py",
         "ai-agent-python:latest", {"python", "/code/code.py"}, python_tools()},
        {Language::JavaScript, "javascript", {"javascript", "js", "node", "nodejs"}, "code.js",
         "ai-agent-javascript:latest", {"node", "/code/code.js"}, javascript_tools()},
        {Language::Java, "java", {"java"}, "Main.java",
         "ai-agent-java:latest",
         {"/bin/sh", "-c", "javac -d /tmp/out /code/Main.java && java -cp /tmp/out Main"},
         java_tools()},
        {Language::C, "c", {"c"}, "code.c",
         "ai-agent-c:latest",
         {"/bin/sh", "-c", "gcc /code/code.c -o /tmp/program && /tmp/program"},
         c_tools()},
        {Language::Cpp, "cpp", {"cpp", "c++", "cplusplus"}, "code.cpp",
         "ai-agent-cpp:latest",
         {"/bin/sh", "-c", "g++ /code/code.cpp -o /tmp/program && /tmp/program"},
         cpp_tools()},
        {Language::Go, "go", {"go", "golang"}, "code.go",
         "golang:1.21-alpine", {"go", "run", "/code/code.go"}, go_tools()},
    }};
}

const std::array<LanguageSpec, kLanguageCount>& registry() {
    static const auto table = build_registry();
    return table;
}

std::string lowercase_trimmed(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

static_assert(static_cast<size_t>(Language::Go) + 1 == kLanguageCount,
              "every Language needs a registry entry");

// No default branch: -Wswitch flags an enumerator without a slot.
static size_t slot_of(Language lang) {
    switch (lang) {
        case Language::Python: return 0;
        case Language::JavaScript: return 1;
        case Language::Java: return 2;
        case Language::C: return 3;
        case Language::Cpp: return 4;
        case Language::Go: return 5;
    }
    throw std::out_of_range("unknown Language value");
}

const LanguageSpec& language_spec(Language lang) {
    return registry()[slot_of(lang)];
}

const std::array<Language, kLanguageCount>& all_languages() {
    static const std::array<Language, kLanguageCount> langs = {
        Language::Python, Language::JavaScript, Language::Java,
        Language::C, Language::Cpp, Language::Go};
    return langs;
}

std::string to_string(Language lang) {
    return language_spec(lang).name;
}

std::optional<Language> language_from_string(const std::string& name) {
    std::string needle = lowercase_trimmed(name);
    if (needle.empty()) return std::nullopt;
    for (const auto& spec : registry()) {
        for (const auto& alias : spec.aliases) {
            if (alias == needle) return spec.id;
        }
    }
    return std::nullopt;
}

std::string supported_languages_list() {
    std::string out;
    for (Language lang : all_languages()) {
        if (!out.empty()) out += ", ";
        out += to_string(lang);
    }
    return out;
}

} // namespace code_agent
