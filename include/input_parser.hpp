#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "agent/AgentTypes.hpp"

namespace code_agent {

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// Where a question declares its language. remainder is the declaring line
// with the declaration cut out, or the whole line when the declaration sits
// inside a sentence ("Use Python to ...").
struct LanguageDeclaration {
    Language language;
    size_t line;
    std::string remainder;
};

struct ParsedAssignment {
    AssignmentMeta meta;
    std::vector<Question> questions;
};

// Splits an assignment file into metadata and numbered questions.
//
//   Subject: Data Structures
//   Name: A. Student
//
//   Question 1: Reverse a linked list.
//   Language: C++
//
//   Q2
//   Python
//   Print the first ten primes.
//   Requirements:
//   - use a sieve
//
// A file without any question header is a single question.
class InputParser {
public:
    // Throws ParseError on empty input, a question without a detectable or
    // supported language, or an empty problem.
    static ParsedAssignment parse(const std::string& contents);

    static ParsedAssignment parse_file(const std::string& path);

    // Throws ParseError for an explicitly declared but unsupported language.
    static std::optional<LanguageDeclaration> detect_language(const std::vector<std::string>& lines);
};

} // namespace code_agent
