#include "input_parser.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace code_agent {

namespace {

const std::regex kQuestionHeader(R"(^\s*(?:question|q)\s*(\d+)\s*[.:)\-]?(?:\s+(.*))?$)", std::regex::icase);
const std::regex kMetaLine(
    R"(^\s*(subject|assignment(?:\s*(?:no\.?|number))?|name|class|div(?:ision)?|roll\s*no\.?|batch)\s*[:\-]\s*(.*)$)",
    std::regex::icase);
const std::regex kRequirementsHeader(R"(^\s*requirements?\s*:\s*(.*)$)", std::regex::icase);
const std::regex kBullet(R"(^\s*(?:[-*]|•|\d+[.)])\s+(.*)$)");
const std::regex kProblemHeader(R"(^\s*(?:problem|task)\s*(?::\s*(.*))?$)", std::regex::icase);

struct DeclarationPattern {
    std::regex re;
    bool in_sentence;   // only trusted when the captured word is a known language
};

// Ordered: the first pattern that matches anywhere in the segment wins.
const std::vector<DeclarationPattern>& declaration_patterns() {
    static const std::vector<DeclarationPattern> patterns = {
        {std::regex(R"(programming\s+language\s*:\s*([A-Za-z][\w+#]*))", std::regex::icase), false},
        {std::regex(R"(language\s*:\s*([A-Za-z][\w+#]*))", std::regex::icase), false},
        {std::regex(R"(\buse\s+([A-Za-z][\w+#]*))", std::regex::icase), true},
        {std::regex(R"(\bwrite\s+in\s+([A-Za-z][\w+#]*))", std::regex::icase), true},
        {std::regex(R"(\bcode\s+in\s+([A-Za-z][\w+#]*))", std::regex::icase), true},
    };
    return patterns;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

void apply_meta(AssignmentMeta& meta, const std::string& raw_key, const std::string& raw_value) {
    std::string key = lower(raw_key);
    std::string value = trim_copy(raw_value);
    if (key == "subject") {
        meta.subject = value;
    } else if (key.rfind("assignment", 0) == 0) {
        try {
            meta.assignment_number = std::stoi(value);
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring non-numeric assignment number '{}'", value);
        }
    } else if (key == "name") {
        meta.name = value;
    } else if (key == "class") {
        meta.class_name = value;
    } else if (key.rfind("div", 0) == 0) {
        meta.division = value;
    } else if (key.rfind("roll", 0) == 0) {
        meta.roll_no = value;
    } else if (key == "batch") {
        meta.batch = value;
    }
}

struct Segment {
    std::vector<std::string> lines;
};

Question build_question(int number, std::vector<std::string> lines) {
    auto declared = InputParser::detect_language(lines);
    if (!declared) {
        throw ParseError("Question " + std::to_string(number) +
                         ": could not detect programming language. "
                         "Please specify language using 'Language: Python' format");
    }
    lines[declared->line] = declared->remainder;

    Question q;
    q.number = number;
    q.language = declared->language;

    std::vector<std::string> problem_lines;
    bool in_requirements = false;
    for (const auto& line : lines) {
        std::smatch m;
        if (std::regex_match(line, m, kRequirementsHeader)) {
            in_requirements = true;
            std::string inline_req = trim_copy(m[1].str());
            if (!inline_req.empty()) q.requirements.push_back(inline_req);
            continue;
        }
        if (in_requirements) {
            if (std::regex_match(line, m, kBullet)) {
                std::string req = trim_copy(m[1].str());
                if (!req.empty()) q.requirements.push_back(req);
                continue;
            }
            if (blank(line)) continue;
            in_requirements = false;
        }
        if (std::regex_match(line, m, kProblemHeader)) {
            std::string rest = m[1].matched ? trim_copy(m[1].str()) : "";
            if (!rest.empty()) problem_lines.push_back(rest);
            continue;
        }
        problem_lines.push_back(line);
    }

    std::string problem;
    for (const auto& l : problem_lines) {
        problem += l;
        problem += '\n';
    }
    q.problem = trim_copy(problem);
    if (q.problem.empty()) {
        throw ParseError("Question " + std::to_string(number) + ": problem description is empty");
    }
    return q;
}

} // namespace

std::optional<LanguageDeclaration> InputParser::detect_language(const std::vector<std::string>& lines) {
    for (const auto& pattern : declaration_patterns()) {
        for (size_t i = 0; i < lines.size(); ++i) {
            for (std::sregex_iterator it(lines[i].begin(), lines[i].end(), pattern.re), end; it != end; ++it) {
                const std::smatch& m = *it;
                std::string word = m[1].str();
                auto lang = language_from_string(word);
                if (!lang) {
                    if (pattern.in_sentence) continue;   // "Use recursion" is not a declaration
                    throw ParseError("Unsupported language: " + word + ". Supported: " + supported_languages_list());
                }
                std::string remainder = m.prefix().str() + m.suffix().str();
                if (pattern.in_sentence) {
                    // "Use Python." alone is pure declaration; "Use Python to ..." is the problem itself.
                    bool only_punct = remainder.find_first_not_of(" \t.,:;!") == std::string::npos;
                    remainder = only_punct ? "" : lines[i];
                }
                return LanguageDeclaration{*lang, i, blank(remainder) ? "" : remainder};
            }
        }
    }

    // Fallback: a bare language name on the first non-blank line.
    for (size_t i = 0; i < lines.size(); ++i) {
        if (blank(lines[i])) continue;
        std::string first = trim_copy(lines[i]);
        if (!first.empty() && (first.back() == ':' || first.back() == '.')) first.pop_back();
        if (auto lang = language_from_string(first)) {
            return LanguageDeclaration{*lang, i, ""};
        }
        break;
    }
    return std::nullopt;
}

ParsedAssignment InputParser::parse(const std::string& contents) {
    if (blank(contents)) throw ParseError("Input file is empty");

    const auto lines = split_lines(contents);
    ParsedAssignment out;
    out.meta.subject = "Assignment";

    size_t first_header = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (std::regex_match(lines[i], kQuestionHeader)) {
            first_header = i;
            break;
        }
    }

    std::vector<Segment> segments;
    std::smatch m;
    if (first_header == lines.size()) {
        // Single-question file: leading meta lines, then the body.
        size_t i = 0;
        for (; i < lines.size(); ++i) {
            if (blank(lines[i])) continue;
            if (!std::regex_match(lines[i], m, kMetaLine)) break;
            apply_meta(out.meta, m[1].str(), m[2].str());
        }
        Segment seg;
        seg.lines.assign(lines.begin() + static_cast<std::ptrdiff_t>(i), lines.end());
        if (std::any_of(seg.lines.begin(), seg.lines.end(), [](const std::string& l) { return !blank(l); })) {
            segments.push_back(std::move(seg));
        }
    } else {
        for (size_t i = 0; i < first_header; ++i) {
            if (std::regex_match(lines[i], m, kMetaLine)) apply_meta(out.meta, m[1].str(), m[2].str());
        }
        for (size_t i = first_header; i < lines.size(); ++i) {
            if (std::regex_match(lines[i], m, kQuestionHeader)) {
                segments.emplace_back();
                std::string trailing = m[2].matched ? trim_copy(m[2].str()) : "";
                if (!trailing.empty()) segments.back().lines.push_back(trailing);
                continue;
            }
            segments.back().lines.push_back(lines[i]);
        }
    }

    if (segments.empty()) throw ParseError("No questions found in input");

    int number = 0;
    for (auto& seg : segments) {
        out.questions.push_back(build_question(++number, std::move(seg.lines)));
    }

    spdlog::info("📄 Parsed {} question(s) for {} assignment {}", out.questions.size(),
                 out.meta.subject, out.meta.assignment_number);
    return out;
}

ParsedAssignment InputParser::parse_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw ParseError("Input file not found: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    spdlog::info("📄 Parsing input file {}", path);
    return parse(ss.str());
}

} // namespace code_agent
