#pragma once

// ---------------------------------------------------------------------------
// system_prompt.hpp
//
// 외부 모델 호출 시 함께 전달할 system prompt 를 활성 RuleSet 에서 만든다.
//   1. 기본 지시문 (scope 표기 포함)
//   2. Guidelines
//   3. Forbidden Topics
//   4. 카테고리별 활성 규칙 "<name>: <description>" (카테고리 선언 순서)
// 규칙 패턴 원문은 포함하지 않는다 (우회 힌트 제공 방지).
// ---------------------------------------------------------------------------

#include <string>

#include "common/types.hpp"  // Scope
#include "policy/rule.hpp"   // RuleSet

[[nodiscard]] std::string build_system_prompt(const RuleSet& ruleset, const Scope& scope);
