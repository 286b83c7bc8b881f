#pragma once

// ---------------------------------------------------------------------------
// audit_record.hpp
//
// 파이프라인 호출 1회당 1개 생성되는 감사 기록.
// 생성 후 변경하지 않으며 호출자에게 소유권이 넘어간다 (코어는 저장하지 않는다).
//
// [민감정보 취급]
// - 원문 입력 대신 salt 가 섞인 SHA-256 fingerprint 만 보관한다.
// - actions 는 rule id / category / 전략 / hash digest 만 담는다.
// - errors 는 오류 코드와 rule id 만 담는다 (매치 문자열 미포함).
// ---------------------------------------------------------------------------

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"                 // Scope
#include "masking/masking_engine.hpp"       // AppliedAction
#include "policy/compliance_evaluator.hpp"  // Decision

struct AuditRecord {
    std::string                           correlation_id{};
    std::string                           input_fingerprint{};  // sha256(salt || input)
    std::string                           ruleset_version{};    // 스냅샷 없음 → 빈 문자열
    Scope                                 scope{};
    Decision                              decision{};           // 입력/출력 중 더 제한적인 판정
    DecisionStatus                        input_status{DecisionStatus::kBlock};
    std::optional<DecisionStatus>         output_status{};      // 모델 미호출 시 없음
    bool                                  model_invoked{false};
    std::vector<std::string>              fired_rules{};        // 최초 발동 순서, 중복 없음
    std::vector<AppliedAction>            actions{};            // 입력 → 출력 순
    std::vector<std::string>              errors{};             // "<stage>:<code>:<ref>"
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};
