#include "agent/Collaborators.hpp"
#include <algorithm>
#include <cctype>

namespace code_agent {

bool review_passed(const std::string& feedback) {
    static const std::string kSentinel = "PASS";
    auto it = std::search(feedback.begin(), feedback.end(), kSentinel.begin(), kSentinel.end(),
                          [](char a, char b) {
                              return std::toupper(static_cast<unsigned char>(a)) == b;
                          });
    return it != feedback.end();
}

} // namespace code_agent
