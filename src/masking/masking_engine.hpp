#pragma once

// ---------------------------------------------------------------------------
// masking_engine.hpp
//
// PatternMatcher 가 만든 MatchSpan 목록을 규칙별 전략에 따라 치환하여
// 정제된(sanitized) 텍스트를 만든다.
//
// [적용 순서]
// span 을 start 내림차순으로 적용한다. 뒤쪽부터 치환하므로 앞쪽 치환의
// 길이 변화가 아직 적용하지 않은 span 의 offset 을 무효화하지 않는다.
//
// [전략]
//   mask  : rule.mask_token (기본 "[<CATEGORY>]") 으로 치환
//   redact: 길이 0 치환
//   hash  : "[<CATEGORY>:h<digest16>]" 으로 치환. digest 는 결정적이다.
//   none  : 원문 유지, AppliedAction 만 기록
//
// [감사 원칙]
// AppliedAction 은 원문 매치 문자열을 보관하지 않는다.
// rule_id / category / 전략 / (hash 일 때) digest 만 남긴다.
//
// [Fail-close]
// - span 의 rule_id 가 규칙셋에 없으면 mask 로 처리한다 (원문 노출 금지).
// - hash digest 계산이 실패하면 mask 로 대체한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "matcher/pattern_matcher.hpp"  // MatchSpan
#include "policy/rule.hpp"              // RuleSet, MaskingMethod

// ---------------------------------------------------------------------------
// AppliedAction
//   span 하나에 실제로 적용된 전략 기록.
//   start/end 는 원문 기준 offset.
// ---------------------------------------------------------------------------
struct AppliedAction {
    std::string   rule_id{};
    std::string   category{};
    MaskingMethod method{MaskingMethod::kMask};
    std::size_t   start{0};
    std::size_t   end{0};
    std::string   digest{};  // method == kHash 일 때만

    // 원문이 출력에서 제거되었는지 (none 만 false)
    [[nodiscard]] bool neutralized() const noexcept { return method != MaskingMethod::kNone; }
};

// ---------------------------------------------------------------------------
// MaskingResult
//   actions 는 start 오름차순 (span 순서와 동일).
// ---------------------------------------------------------------------------
struct MaskingResult {
    std::string                sanitized_text{};
    std::vector<AppliedAction> actions{};
};

class MaskingEngine {
public:
    // digest_salt: hash 전략 digest 에 섞을 salt (설정 주입)
    explicit MaskingEngine(std::string digest_salt = {});

    // apply
    //   spans 는 PatternMatcher 결과 (비중첩, start 오름차순) 여야 한다.
    //   범위를 벗어나거나 겹치는 span 은 건너뛰고 경고한다.
    [[nodiscard]] MaskingResult apply(std::string_view              text,
                                      const std::vector<MatchSpan>& spans,
                                      const RuleSet&                ruleset) const;

    // digest: hash 전략이 쓰는 16자 digest
    [[nodiscard]] std::string digest(std::string_view value) const;

private:
    std::string digest_salt_;
};
