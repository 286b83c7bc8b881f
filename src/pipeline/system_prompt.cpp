// ---------------------------------------------------------------------------
// system_prompt.cpp
// ---------------------------------------------------------------------------

#include "pipeline/system_prompt.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

#include "matcher/pattern_matcher.hpp"  // PatternMatcher::rule_in_scope

namespace {

std::string title_case(std::string s) {
    bool start = true;
    for (auto& c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c     = static_cast<char>(start ? std::toupper(uc) : std::tolower(uc));
            start = false;
        } else {
            start = true;
        }
    }
    return s;
}

}  // namespace

std::string build_system_prompt(const RuleSet& ruleset, const Scope& scope) {
    std::ostringstream prompt;
    prompt << "You are an AI assistant operating under content policy version "
           << (ruleset.version.empty() ? "unversioned" : ruleset.version);
    if (!scope.empty()) {
        prompt << " (scope:";
        if (!scope.country.empty()) {
            prompt << " country=" << scope.country;
        }
        if (!scope.language.empty()) {
            prompt << " language=" << scope.language;
        }
        if (!scope.domain.empty()) {
            prompt << " domain=" << scope.domain;
        }
        prompt << ')';
    }
    prompt << ".\nRespond respectfully and never reconstruct content that was replaced by a "
              "placeholder token.\n";

    if (!ruleset.guidelines.empty()) {
        prompt << "\nGuidelines:\n";
        for (const auto& guideline : ruleset.guidelines) {
            prompt << "- " << guideline << '\n';
        }
    }

    if (!ruleset.forbidden_topics.empty()) {
        prompt << "\nForbidden Topics:\n";
        for (const auto& topic : ruleset.forbidden_topics) {
            prompt << "- " << topic << '\n';
        }
    }

    std::size_t rule_lines = 0;
    for (const auto& category : ruleset.categories) {
        bool header_written = false;
        for (const auto& rule : ruleset.rules) {
            if (rule.category != category.name || !PatternMatcher::rule_in_scope(rule, scope)) {
                continue;
            }
            if (!header_written) {
                prompt << '\n' << title_case(category.name) << " Rules:\n";
                header_written = true;
            }
            prompt << "- " << (rule.name.empty() ? rule.id : rule.name);
            if (!rule.description.empty()) {
                prompt << ": " << rule.description;
            }
            prompt << '\n';
            ++rule_lines;
        }
    }

    spdlog::debug("system_prompt: built for ruleset {} ({} guidelines, {} topics, {} rules)",
                  ruleset.version, ruleset.guidelines.size(), ruleset.forbidden_topics.size(),
                  rule_lines);
    return prompt.str();
}
