#pragma once

// ---------------------------------------------------------------------------
// pattern_matcher.hpp
//
// RuleSet 스냅샷의 패턴 규칙을 텍스트에 적용하여 서로 겹치지 않는
// MatchSpan 목록을 만든다.
//
// [Overlap 정책]
// 1. 규칙은 규칙셋 순서(앞 → 뒤)로 평가한다.
// 2. 규칙 하나 안에서는 왼쪽부터 greedy 스캔 (leftmost-first, 비중첩).
//    다음 탐색은 직전 매치의 끝에서 시작한다.
// 3. 이미 수락된 구간과 조금이라도 겹치는 매치는 버린다.
//    → 먼저 나온 규칙이 항상 이긴다. 버려진 매치 자리에서 더 짧은 매치를
//      다시 찾지 않는다.
// 4. 길이 0 매치는 구간으로 만들지 않는다.
//
// [예산 (catastrophic matching 방지)]
// RE2 는 선형 시간 매칭을 보장하지만, 규칙별로 시간 예산과 최대 매치 수를
// 추가로 적용한다. 예산 초과 시 그 규칙의 이번 요청 결과 전체를 버리고
// MatchError 로 보고한다. 나머지 규칙은 계속 평가된다.
//
// [순수성]
// match() 는 스냅샷과 입력 텍스트를 수정하지 않으며 부수효과가 없다
// (진단 로그 제외). 여러 스레드에서 동시 호출 안전.
//
// [offset 단위]
// start/end 는 UTF-8 바이트 offset 이다. [start, end) 반개구간.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // Scope, MatchError
#include "policy/rule.hpp"   // Rule, RuleSet

// ---------------------------------------------------------------------------
// MatchSpan
//   매치 구간 하나. text 는 원문 부분 문자열로, 요청 범위 안에서만 산다.
//   감사 로그에는 절대 기록하지 않는다 (rule_id / category 만 기록).
// ---------------------------------------------------------------------------
struct MatchSpan {
    std::size_t start{0};
    std::size_t end{0};
    std::string text{};
    std::string rule_id{};
    std::string category{};
};

// ---------------------------------------------------------------------------
// MatchOptions
//   rule_time_budget   : 규칙 하나의 스캔에 허용되는 최대 시간
//   max_matches_per_rule: 규칙 하나가 한 요청에서 만들 수 있는 최대 매치 수
// ---------------------------------------------------------------------------
struct MatchOptions {
    std::chrono::microseconds rule_time_budget{std::chrono::milliseconds{50}};
    std::size_t               max_matches_per_rule{10000};
};

// ---------------------------------------------------------------------------
// MatchResult
//   spans : start 오름차순, 서로 겹치지 않음
//   errors: 이번 요청에서 건너뛴 규칙 목록 (MatchRuntimeError)
// ---------------------------------------------------------------------------
struct MatchResult {
    std::vector<MatchSpan>  spans{};
    std::vector<MatchError> errors{};
};

class PatternMatcher {
public:
    explicit PatternMatcher(MatchOptions options = {});

    // match
    //   text    : 검사할 원문
    //   snapshot: 요청 시작 시 취득한 불변 스냅샷
    //   scope   : 요청이 선언한 scope. 규칙의 country/language 가 비어있으면
    //             모든 scope 와 매치, 요청 필드가 비어있으면 모든 규칙과 매치.
    [[nodiscard]] MatchResult match(std::string_view text,
                                    const RuleSet&   snapshot,
                                    const Scope&     scope) const;

    // rule_in_scope: enabled 여부와 country/language 필터
    [[nodiscard]] static bool rule_in_scope(const Rule& rule, const Scope& scope) noexcept;

    [[nodiscard]] const MatchOptions& options() const noexcept { return options_; }

private:
    MatchOptions options_;
};
