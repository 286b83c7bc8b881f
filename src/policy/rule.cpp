// ---------------------------------------------------------------------------
// rule.cpp
//
// MaskingMethod / Severity 문자열 변환과 RuleSet 조회 헬퍼.
// ---------------------------------------------------------------------------

#include "policy/rule.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

}  // namespace

std::string_view to_string(MaskingMethod method) noexcept {
    switch (method) {
        case MaskingMethod::kMask:   return "mask";
        case MaskingMethod::kRedact: return "redact";
        case MaskingMethod::kHash:   return "hash";
        case MaskingMethod::kNone:   return "none";
    }
    return "mask";
}

std::string_view to_string(Severity severity) noexcept {
    return severity == Severity::kHigh ? "high" : "low";
}

// 규칙 파일 값은 소문자 enum 문자열만 허용한다.
// 원래 시스템의 "asterisk" 같은 별칭은 받지 않는다 (RuleError 로 보고).
std::optional<MaskingMethod> parse_masking_method(std::string_view text) noexcept {
    if (text == "mask")   return MaskingMethod::kMask;
    if (text == "redact") return MaskingMethod::kRedact;
    if (text == "hash")   return MaskingMethod::kHash;
    if (text == "none")   return MaskingMethod::kNone;
    return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view text) noexcept {
    if (iequals(text, "high")) return Severity::kHigh;
    if (iequals(text, "low"))  return Severity::kLow;
    return std::nullopt;
}

const Category* RuleSet::find_category(std::string_view name) const noexcept {
    const auto it = std::find_if(categories.begin(), categories.end(),
                                 [name](const Category& c) { return c.name == name; });
    return it == categories.end() ? nullptr : &*it;
}

const Rule* RuleSet::find_rule(std::string_view id) const noexcept {
    const auto it = std::find_if(rules.begin(), rules.end(),
                                 [id](const Rule& r) { return r.id == id; });
    return it == rules.end() ? nullptr : &*it;
}

Severity RuleSet::severity_of(std::string_view category) const noexcept {
    const Category* c = find_category(category);
    return c == nullptr ? Severity::kHigh : c->severity;
}
