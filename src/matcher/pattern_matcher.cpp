// ---------------------------------------------------------------------------
// pattern_matcher.cpp
//
// 규칙 순서 기반 비중첩 매칭 구현.
//
// [구간 집합]
// 수락된 구간은 std::map<start, end> 로 보관한다. 구간끼리 서로소이므로
// 새 후보 [s, e) 의 겹침 검사는 "start < e 인 마지막 구간의 end > s" 하나로 충분하다.
//
// [규칙 단위 커밋]
// 규칙 하나의 스캔 결과는 임시 벡터에 모았다가 스캔이 예산 안에 끝났을 때만
// 구간 집합에 커밋한다. 예산 초과 규칙은 부분 결과도 남기지 않는다.
// ---------------------------------------------------------------------------

#include "matcher/pattern_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>

#include <re2/re2.h>
#include <spdlog/spdlog.h>

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

// 필드 하나의 scope 매칭: 어느 한쪽이 비어있으면 통과
bool field_matches(std::string_view rule_value, std::string_view request_value) {
    return rule_value.empty() || request_value.empty() || iequals(rule_value, request_value);
}

using CoveredSet = std::map<std::size_t, std::size_t>;

bool overlaps(const CoveredSet& covered, std::size_t start, std::size_t end) {
    auto it = covered.lower_bound(end);
    if (it == covered.begin()) {
        return false;
    }
    --it;
    return it->second > start;
}

// 길이 0 매치 이후 다음 UTF-8 코드포인트 시작으로 전진
std::size_t advance_one_char(std::string_view text, std::size_t pos) {
    ++pos;
    while (pos < text.size() &&
           (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
        ++pos;
    }
    return pos;
}

}  // namespace

PatternMatcher::PatternMatcher(MatchOptions options)
    : options_(options) {}

bool PatternMatcher::rule_in_scope(const Rule& rule, const Scope& scope) noexcept {
    return rule.enabled &&
           field_matches(rule.country, scope.country) &&
           field_matches(rule.language, scope.language);
}

// ---------------------------------------------------------------------------
// PatternMatcher::match 구현
// ---------------------------------------------------------------------------
MatchResult PatternMatcher::match(std::string_view text,
                                  const RuleSet&   snapshot,
                                  const Scope&     scope) const {
    MatchResult result{};
    CoveredSet  covered;

    const re2::StringPiece input(text.data(), text.size());

    for (const auto& rule : snapshot.rules) {
        if (!rule_in_scope(rule, scope)) {
            continue;
        }

        if (!rule.pattern || !rule.pattern->ok()) {
            spdlog::warn("pattern_matcher: rule '{}' has no usable compiled pattern, skipping",
                         rule.id);
            result.errors.push_back(MatchError{
                MatchErrorCode::kEngineFailure, rule.id, "pattern not compiled"});
            continue;
        }

        const auto started = std::chrono::steady_clock::now();

        std::vector<std::pair<std::size_t, std::size_t>> accepted;
        std::size_t                                      match_count = 0;
        std::optional<MatchError>                        failure;

        std::size_t pos = 0;
        while (pos <= text.size()) {
            re2::StringPiece found;
            if (!rule.pattern->Match(input, pos, input.size(), re2::RE2::UNANCHORED, &found, 1)) {
                break;
            }

            const auto start = static_cast<std::size_t>(found.data() - input.data());
            const auto end   = start + found.size();

            if (++match_count > options_.max_matches_per_rule) {
                failure = MatchError{
                    MatchErrorCode::kMatchLimitExceeded, rule.id,
                    fmt::format("more than {} matches", options_.max_matches_per_rule)};
                break;
            }
            if (std::chrono::steady_clock::now() - started > options_.rule_time_budget) {
                failure = MatchError{
                    MatchErrorCode::kBudgetExceeded, rule.id,
                    fmt::format("exceeded {}us budget", options_.rule_time_budget.count())};
                break;
            }

            if (end == start) {
                // 길이 0 매치: 구간 없음, 한 글자 전진
                pos = advance_one_char(text, start);
                continue;
            }

            // 이전 규칙이 차지한 구간과 겹치면 버린다 (먼저 나온 규칙 우선)
            if (!overlaps(covered, start, end)) {
                accepted.emplace_back(start, end);
            }
            pos = end;
        }

        if (failure) {
            spdlog::warn("pattern_matcher: rule '{}' skipped for this request ({}): {}",
                         rule.id, to_string(failure->code), failure->message);
            result.errors.push_back(std::move(*failure));
            continue;
        }

        for (const auto& [start, end] : accepted) {
            covered.emplace(start, end);
            result.spans.push_back(MatchSpan{
                start, end, std::string(text.substr(start, end - start)),
                rule.id, rule.category});
        }
    }

    std::sort(result.spans.begin(), result.spans.end(),
              [](const MatchSpan& a, const MatchSpan& b) { return a.start < b.start; });

    spdlog::debug("pattern_matcher: {} spans, {} rule errors (ruleset version={})",
                  result.spans.size(), result.errors.size(), snapshot.version);
    return result;
}
