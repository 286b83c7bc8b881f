#pragma once

// ---------------------------------------------------------------------------
// service_config.hpp
//
// 서비스 설정 (YAML) 로더.
//
// [우선순위]
//   환경변수 (PROMPTGATE_LOG_LEVEL, PROMPTGATE_LOG_PATH)
//     > YAML 파일 (PROMPTGATE_CONFIG, 기본 config/promptgate.yaml)
//     > 구조체 기본값
//
// [검증]
// - 파일 없음 / YAML 문법 오류 → ConfigError (치명적)
// - 잘못된 스칼라 값 → 경고 후 기본값
// - 0 <= warn_threshold <= block_threshold <= 1 위반 → 경고 후 두 임계값 모두 기본값
// - rulesets 항목에 path 가 없으면 경고 후 건너뛴다
// - rulesets 상대 경로는 설정 파일 디렉터리 기준으로 해석한다
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "classifier/heuristic_classifier.hpp"  // HeuristicPattern
#include "common/types.hpp"                     // ConfigError
#include "logger/log_types.hpp"                 // LogLevel
#include "pipeline/pipeline.hpp"                // PipelineOptions
#include "policy/rule_registry.hpp"             // RulesetSource, LoaderOptions

inline constexpr char kDefaultConfigPath[] = "config/promptgate.yaml";

struct ServiceConfig {
    LogLevel                      log_level{LogLevel::kInfo};
    std::filesystem::path         log_path{"/tmp/promptgate.log"};
    PipelineOptions               pipeline{};
    LoaderOptions                 loader{};
    std::vector<RulesetSource>    rulesets{};
    std::vector<HeuristicPattern> classifier_patterns{};  // 비어 있으면 기본 패턴 사용
};

class ServiceConfigLoader {
public:
    [[nodiscard]] static std::expected<ServiceConfig, ConfigError>
    load(const std::filesystem::path& path);

    // base_dir: rulesets 상대 경로 해석 기준
    [[nodiscard]] static std::expected<ServiceConfig, ConfigError>
    load_string(std::string_view document, const std::filesystem::path& base_dir);

    // 환경변수 덮어쓰기 (PROMPTGATE_LOG_LEVEL, PROMPTGATE_LOG_PATH)
    static void apply_env_overrides(ServiceConfig& config);

    // PROMPTGATE_CONFIG 또는 기본 경로
    [[nodiscard]] static std::filesystem::path config_path_from_env();
};
