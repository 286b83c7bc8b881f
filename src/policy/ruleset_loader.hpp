#pragma once

// ---------------------------------------------------------------------------
// ruleset_loader.hpp
//
// JSON 규칙 파일을 읽어 검증하고 불변 RuleSet 으로 변환하는 로더.
//
// [설계 원칙]
// - 규칙 단위 격리: 검증에 실패한 규칙은 스냅샷에서 제외하고 RuleError 로
//   보고한다. 로드 전체를 실패시키지 않는다.
// - 단, 유효 규칙이 0개면 ConfigError(kNoValidRules) 로 로드 전체 실패.
//   사용 가능한 규칙이 없는 규칙셋은 설정 오류로 취급한다.
// - 문서 구조 자체의 오류(파일 없음, 문법 오류, rules 누락)는 ConfigError.
// - 규칙 파일 내용을 로그에 출력하지 않는다 (패턴에 민감 예시가 섞일 수 있음).
//
// [파서]
// JSON 은 YAML flow 스타일의 부분집합이므로 yaml-cpp 로 파싱한다.
// 서비스 설정(YAML)과 같은 파서를 공유한다.
//
// [순환 의존성]
// ruleset_loader.hpp → rule.hpp → common/types.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ConfigError, RuleError
#include "policy/rule.hpp"   // RuleSet, RuleSetPtr

// ---------------------------------------------------------------------------
// LoaderOptions
//   high_severity_categories: 규칙 파일이 심각도를 명시하지 않은 카테고리 중
//                             kHigh 로 취급할 이름 목록 (대소문자 무관).
//   regex_max_mem           : RE2 컴파일 시 메모리 상한 (bytes).
// ---------------------------------------------------------------------------
struct LoaderOptions {
    std::vector<std::string> high_severity_categories{"forbidden"};
    std::int64_t             regex_max_mem{8 << 20};
};

// ---------------------------------------------------------------------------
// LoadResult
//   ruleset    : 검증을 통과한 규칙만 담은 불변 스냅샷 (nullptr 아님)
//   rule_errors: 제외된 규칙 목록 (경고 보고용)
// ---------------------------------------------------------------------------
struct LoadResult {
    RuleSetPtr             ruleset{};
    std::vector<RuleError> rule_errors{};
};

// ---------------------------------------------------------------------------
// RuleSetLoader
//   정적 함수만 제공한다. 상태 없음.
// ---------------------------------------------------------------------------
class RuleSetLoader {
public:
    // load
    //   지정된 경로의 JSON 규칙 파일을 읽어 RuleSet 으로 변환한다.
    //
    //   성공: LoadResult (일부 규칙이 제외되었을 수 있음 → rule_errors 확인)
    //   실패: ConfigError
    //         호출자는 실패 시 반드시 이전 스냅샷을 유지해야 한다.
    [[nodiscard]] static std::expected<LoadResult, ConfigError>
    load(const std::filesystem::path& path, const LoaderOptions& options);

    // load_string
    //   문서 문자열에서 직접 로드한다. origin 은 로그/오류 메시지용 이름.
    //   프리뷰(dry run)와 테스트에서 사용한다.
    [[nodiscard]] static std::expected<LoadResult, ConfigError>
    load_string(std::string_view         document,
                std::string_view         origin,
                const LoaderOptions&     options);
};
