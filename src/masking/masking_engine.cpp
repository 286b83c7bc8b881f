// ---------------------------------------------------------------------------
// masking_engine.cpp
// ---------------------------------------------------------------------------

#include "masking/masking_engine.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <spdlog/spdlog.h>

#include "masking/digest.hpp"

namespace {

[[nodiscard]] std::string default_token(const std::string& category) {
    std::string upper = category;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return "[" + upper + "]";
}

}  // namespace

MaskingEngine::MaskingEngine(std::string digest_salt)
    : digest_salt_(std::move(digest_salt)) {}

std::string MaskingEngine::digest(std::string_view value) const {
    return short_digest(value, digest_salt_);
}

// ---------------------------------------------------------------------------
// MaskingEngine::apply 구현
// ---------------------------------------------------------------------------
MaskingResult MaskingEngine::apply(std::string_view              text,
                                   const std::vector<MatchSpan>& spans,
                                   const RuleSet&                ruleset) const {
    MaskingResult result{};
    result.sanitized_text.assign(text);
    result.actions.reserve(spans.size());

    // 내림차순 적용 순서. 오름차순 입력을 가정하지 않고 직접 정렬한다.
    std::vector<const MatchSpan*> order;
    order.reserve(spans.size());
    for (const auto& span : spans) {
        order.push_back(&span);
    }
    std::sort(order.begin(), order.end(),
              [](const MatchSpan* a, const MatchSpan* b) { return a->start > b->start; });

    std::size_t lowest_applied = text.size() + 1;  // 이미 치환한 구간의 최소 start

    for (const MatchSpan* span : order) {
        if (span->start >= span->end || span->end > text.size() || span->end > lowest_applied) {
            spdlog::warn("masking_engine: invalid or overlapping span [{}, {}) for rule '{}', skipping",
                         span->start, span->end, span->rule_id);
            continue;
        }

        const Rule* rule = ruleset.find_rule(span->rule_id);

        AppliedAction action{};
        action.rule_id  = span->rule_id;
        action.category = span->category;
        action.start    = span->start;
        action.end      = span->end;
        action.method   = rule != nullptr ? rule->masking_method : MaskingMethod::kMask;

        if (rule == nullptr) {
            spdlog::warn("masking_engine: rule '{}' not in ruleset, masking (fail-close)",
                         span->rule_id);
        }

        std::string replacement;
        switch (action.method) {
            case MaskingMethod::kMask:
                replacement = (rule != nullptr && !rule->mask_token.empty())
                            ? rule->mask_token
                            : default_token(span->category);
                break;
            case MaskingMethod::kRedact:
                break;
            case MaskingMethod::kHash:
                action.digest = digest(text.substr(span->start, span->end - span->start));
                if (action.digest.empty()) {
                    spdlog::error("masking_engine: digest failed for rule '{}', masking instead",
                                  span->rule_id);
                    action.method = MaskingMethod::kMask;
                    replacement   = default_token(span->category);
                } else {
                    // 'h' 접두: digest 가 숫자로만 이루어져도 숫자열 규칙에 걸리지 않게 한다
                    std::string token = default_token(span->category);
                    token.insert(token.size() - 1, ":h" + action.digest);
                    replacement = std::move(token);
                }
                break;
            case MaskingMethod::kNone:
                replacement.assign(text.substr(span->start, span->end - span->start));
                break;
        }

        if (action.method != MaskingMethod::kNone) {
            result.sanitized_text.replace(span->start, span->end - span->start, replacement);
        }
        lowest_applied = span->start;
        result.actions.push_back(std::move(action));
    }

    std::reverse(result.actions.begin(), result.actions.end());
    return result;
}
