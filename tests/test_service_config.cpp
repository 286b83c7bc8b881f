// ---------------------------------------------------------------------------
// test_service_config.cpp
//
// ServiceConfigLoader 단위 테스트.
//
// [테스트 범위]
// - 빈 문서 → 구조체 기본값
// - 전체 섹션 파싱 (global / pipeline / matcher / severity / rulesets / classifier)
// - 잘못된 값 → 경고 후 기본값 (임계값 순서, 0 이하 timeout)
// - rulesets 상대 경로 → base_dir 기준 해석, path 없는 항목은 건너뜀
// - 파일 수준 오류 → ConfigError (kParseError / kSchemaError / kFileNotFound)
// - 환경변수 덮어쓰기
// ---------------------------------------------------------------------------

#include "config/service_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

using namespace std::chrono_literals;

constexpr char kFullConfig[] = R"(
global:
  log_level: debug
  log_path: /var/log/promptgate/audit.log

pipeline:
  block_threshold: 0.8
  warn_threshold: 0.4
  fail_open: true
  classifier_timeout_ms: 500
  model_timeout_ms: 10000
  max_input_bytes: 1024
  fingerprint_salt: "pepper"
  worker_threads: 4

matcher:
  rule_time_budget_ms: 20
  max_matches_per_rule: 100
  regex_max_mem: 1048576

severity:
  high_categories: [forbidden, royal, religious]

rulesets:
  - path: rules/default.json
  - path: /etc/promptgate/bn.json
    country: BN
    language: ms
    domain: islamic

classifier:
  patterns:
    - { label: injection, pattern: "ignore previous", score: 0.95 }
    - { label: unsafe-topic:gambling, pattern: "casino" }
)";

// 환경변수를 테스트 종료 시 원복
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value)
        : name_(name) {
        if (const char* prev = std::getenv(name)) {
            previous_ = prev;
            had_previous_ = true;
        }
        ::setenv(name, value, 1);
    }

    ~ScopedEnv() {
        if (had_previous_) {
            ::setenv(name_, previous_.c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&)            = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::string previous_{};
    bool        had_previous_{false};
};

}  // namespace

// ---------------------------------------------------------------------------
// LoadString_EmptyDocumentUsesDefaults
// ---------------------------------------------------------------------------
TEST(ServiceConfig, LoadString_EmptyDocumentUsesDefaults) {
    const auto config = ServiceConfigLoader::load_string("", "/etc/promptgate");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->log_level, LogLevel::kInfo);
    EXPECT_EQ(config->log_path, fs::path("/tmp/promptgate.log"));
    EXPECT_DOUBLE_EQ(config->pipeline.evaluator.block_threshold, 0.7);
    EXPECT_DOUBLE_EQ(config->pipeline.evaluator.warn_threshold, 0.3);
    EXPECT_FALSE(config->pipeline.evaluator.fail_open);
    EXPECT_EQ(config->pipeline.classifier_timeout, 2000ms);
    EXPECT_EQ(config->pipeline.max_input_bytes, 65536u);
    EXPECT_TRUE(config->rulesets.empty());
    EXPECT_TRUE(config->classifier_patterns.empty());
    ASSERT_EQ(config->loader.high_severity_categories.size(), 1u);
    EXPECT_EQ(config->loader.high_severity_categories[0], "forbidden");
}

// ---------------------------------------------------------------------------
// LoadString_ParsesAllSections
// ---------------------------------------------------------------------------
TEST(ServiceConfig, LoadString_ParsesAllSections) {
    const auto config = ServiceConfigLoader::load_string(kFullConfig, "/srv/promptgate");
    ASSERT_TRUE(config.has_value()) << config.error().message;

    EXPECT_EQ(config->log_level, LogLevel::kDebug);
    EXPECT_EQ(config->log_path, fs::path("/var/log/promptgate/audit.log"));

    const auto& pipeline = config->pipeline;
    EXPECT_DOUBLE_EQ(pipeline.evaluator.block_threshold, 0.8);
    EXPECT_DOUBLE_EQ(pipeline.evaluator.warn_threshold, 0.4);
    EXPECT_TRUE(pipeline.evaluator.fail_open);
    EXPECT_EQ(pipeline.classifier_timeout, 500ms);
    EXPECT_EQ(pipeline.model_timeout, 10000ms);
    EXPECT_EQ(pipeline.max_input_bytes, 1024u);
    EXPECT_EQ(pipeline.fingerprint_salt, "pepper");
    EXPECT_EQ(pipeline.worker_threads, 4u);
    EXPECT_EQ(pipeline.matcher.rule_time_budget, 20ms);
    EXPECT_EQ(pipeline.matcher.max_matches_per_rule, 100u);
    EXPECT_EQ(config->loader.regex_max_mem, 1048576);

    const std::vector<std::string> high{"forbidden", "royal", "religious"};
    EXPECT_EQ(config->loader.high_severity_categories, high);

    ASSERT_EQ(config->rulesets.size(), 2u);
    EXPECT_EQ(config->rulesets[0].path, fs::path("/srv/promptgate/rules/default.json"));
    EXPECT_TRUE(config->rulesets[0].scope.empty());
    EXPECT_EQ(config->rulesets[1].path, fs::path("/etc/promptgate/bn.json"));
    EXPECT_EQ(config->rulesets[1].scope.country, "BN");
    EXPECT_EQ(config->rulesets[1].scope.language, "ms");
    EXPECT_EQ(config->rulesets[1].scope.domain, "islamic");

    ASSERT_EQ(config->classifier_patterns.size(), 2u);
    EXPECT_EQ(config->classifier_patterns[0].label, "injection");
    EXPECT_DOUBLE_EQ(config->classifier_patterns[0].score, 0.95);
    EXPECT_EQ(config->classifier_patterns[1].label, "unsafe-topic:gambling");
    EXPECT_DOUBLE_EQ(config->classifier_patterns[1].score, 0.9);
}

// ---------------------------------------------------------------------------
// 잘못된 값 → 기본값
// ---------------------------------------------------------------------------
TEST(ServiceConfig, LoadString_InvalidThresholdsFallBackToDefaults) {
    const auto config = ServiceConfigLoader::load_string(R"(
pipeline:
  block_threshold: 0.2
  warn_threshold: 0.5
  fail_open: true
)", "");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->pipeline.evaluator.block_threshold, 0.7);
    EXPECT_DOUBLE_EQ(config->pipeline.evaluator.warn_threshold, 0.3);
    EXPECT_TRUE(config->pipeline.evaluator.fail_open) << "fail_open survives threshold fallback";
}

TEST(ServiceConfig, LoadString_NonPositiveValuesIgnored) {
    const auto config = ServiceConfigLoader::load_string(R"(
global:
  log_level: verbose
pipeline:
  classifier_timeout_ms: 0
  model_timeout_ms: -5
  max_input_bytes: 0
  block_threshold: high
matcher:
  max_matches_per_rule: 0
)", "");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log_level, LogLevel::kInfo);
    EXPECT_EQ(config->pipeline.classifier_timeout, 2000ms);
    EXPECT_EQ(config->pipeline.model_timeout, 30000ms);
    EXPECT_EQ(config->pipeline.max_input_bytes, 65536u);
    EXPECT_DOUBLE_EQ(config->pipeline.evaluator.block_threshold, 0.7);
    EXPECT_EQ(config->pipeline.matcher.max_matches_per_rule, 10000u);
}

TEST(ServiceConfig, LoadString_RulesetWithoutPathSkipped) {
    const auto config = ServiceConfigLoader::load_string(R"(
rulesets:
  - country: SG
  - path: ""
  - plain-string
  - path: sg.json
    country: SG
)", "/cfg");
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->rulesets.size(), 1u);
    EXPECT_EQ(config->rulesets[0].path, fs::path("/cfg/sg.json"));
    EXPECT_EQ(config->rulesets[0].scope.country, "SG");
}

TEST(ServiceConfig, LoadString_ClassifierPatternWithoutLabelSkipped) {
    const auto config = ServiceConfigLoader::load_string(R"(
classifier:
  patterns:
    - { pattern: "no label" }
    - { label: jailbreak }
    - { label: jailbreak, pattern: "dan mode", score: 0.5 }
)", "");
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->classifier_patterns.size(), 1u);
    EXPECT_EQ(config->classifier_patterns[0].pattern, "dan mode");
}

// ---------------------------------------------------------------------------
// 파일 수준 오류
// ---------------------------------------------------------------------------
TEST(ServiceConfig, LoadString_SyntaxErrorIsParseError) {
    const auto config = ServiceConfigLoader::load_string("pipeline: [unclosed", "");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigErrorCode::kParseError);
    EXPECT_NE(config.error().message.find("line"), std::string::npos);
}

TEST(ServiceConfig, LoadString_NonMappingRootIsSchemaError) {
    const auto config = ServiceConfigLoader::load_string("- a\n- b\n", "");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigErrorCode::kSchemaError);
}

TEST(ServiceConfig, Load_MissingFileIsFileNotFound) {
    const auto config = ServiceConfigLoader::load("/nonexistent/promptgate.yaml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigErrorCode::kFileNotFound);
    EXPECT_EQ(config.error().context, "/nonexistent/promptgate.yaml");
}

// ---------------------------------------------------------------------------
// 환경변수
// ---------------------------------------------------------------------------
TEST(ServiceConfig, ApplyEnvOverrides) {
    ServiceConfig config{};
    {
        ScopedEnv level("PROMPTGATE_LOG_LEVEL", "error");
        ScopedEnv path("PROMPTGATE_LOG_PATH", "/tmp/override.log");
        ServiceConfigLoader::apply_env_overrides(config);
    }
    EXPECT_EQ(config.log_level, LogLevel::kError);
    EXPECT_EQ(config.log_path, fs::path("/tmp/override.log"));

    {
        ScopedEnv level("PROMPTGATE_LOG_LEVEL", "loud");
        ServiceConfigLoader::apply_env_overrides(config);
    }
    EXPECT_EQ(config.log_level, LogLevel::kError) << "invalid value keeps configured level";
}

TEST(ServiceConfig, ConfigPathFromEnv) {
    {
        ScopedEnv env("PROMPTGATE_CONFIG", "/opt/pg/custom.yaml");
        EXPECT_EQ(ServiceConfigLoader::config_path_from_env(), fs::path("/opt/pg/custom.yaml"));
    }
    ::unsetenv("PROMPTGATE_CONFIG");
    EXPECT_EQ(ServiceConfigLoader::config_path_from_env(), fs::path(kDefaultConfigPath));
}

// ---------------------------------------------------------------------------
// 배포 설정 파일 (config/promptgate.yaml)
// ---------------------------------------------------------------------------
TEST(ServiceConfig, Load_ShippedConfig) {
    const fs::path path = kDefaultConfigPath;
    if (!fs::exists(path)) {
        GTEST_SKIP() << "config/promptgate.yaml not found from working directory";
    }

    const auto config = ServiceConfigLoader::load(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->rulesets.size(), 2u);
    EXPECT_EQ(config->classifier_patterns.size(), 5u);
    for (const auto& source : config->rulesets) {
        EXPECT_TRUE(fs::exists(source.path)) << source.path;
    }
}
