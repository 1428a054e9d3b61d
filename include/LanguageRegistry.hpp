#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace code_agent {

// The closed set of runtimes a candidate can target. Detection, execution and
// validation all index the same table, so adding an enumerator means adding
// one LanguageSpec entry (enforced by the static_assert in language_registry.cpp).
enum class Language {
    Python,
    JavaScript,
    Java,
    C,
    Cpp,
    Go,
};

constexpr size_t kLanguageCount = 6;

// How a validation tool's raw output is judged.
enum class EscalationKind {
    Keywords,   // escalate when any keyword appears (case-insensitive)
    AnyOutput   // escalate on any non-blank output
};

struct ToolSpec {
    std::string name;
    std::vector<std::string> command;   // argv run inside the container
    EscalationKind escalation = EscalationKind::Keywords;
    std::vector<std::string> keywords;
};

struct LanguageSpec {
    Language id;
    std::string name;                   // canonical lowercase name
    std::vector<std::string> aliases;   // accepted spellings for detection
    std::string source_file;            // file name inside the scratch dir
    std::string default_image;
    std::vector<std::string> run_command;
    std::vector<ToolSpec> tools;
};

const LanguageSpec& language_spec(Language lang);
const std::array<Language, kLanguageCount>& all_languages();

std::string to_string(Language lang);

// Case-insensitive alias lookup; surrounding whitespace is ignored.
std::optional<Language> language_from_string(const std::string& name);

// "python, javascript, java, c, cpp, go"
std::string supported_languages_list();

} // namespace code_agent
