// ---------------------------------------------------------------------------
// service_config.cpp
//
// YAML 서비스 설정을 ServiceConfig 로 파싱한다.
//
// [설계 원칙]
// - 필드 누락 시 구조체 기본값을 적용한다.
// - 잘못된 값은 경고 후 기본값. 파일 수준 오류만 ConfigError 로 반환한다.
// - 설정 파일 전체를 로그에 출력하지 않는다 (fingerprint_salt 보호).
// ---------------------------------------------------------------------------

#include "config/service_config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 읽기. 없으면 nullopt, 변환 실패 시 경고 후 nullopt.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] std::optional<T> read_value(const YAML::Node& node, std::string_view key) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        spdlog::warn("service_config: invalid value for '{}', using default", key);
        return std::nullopt;
    }
}

template <typename T>
void assign_if(T& target, const YAML::Node& node, std::string_view key) {
    if (auto value = read_value<T>(node, key)) {
        target = std::move(*value);
    }
}

void assign_timeout(std::chrono::milliseconds& target, const YAML::Node& node, std::string_view key) {
    if (const auto value = read_value<long long>(node, key)) {
        if (*value <= 0) {
            spdlog::warn("service_config: '{}' must be positive, using default {}ms",
                         key, target.count());
            return;
        }
        target = std::chrono::milliseconds{*value};
    }
}

[[nodiscard]] std::optional<std::string> env_value(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string(val);
    }
    return std::nullopt;
}

void parse_global(const YAML::Node& node, ServiceConfig& config) {
    if (!node) {
        return;
    }
    if (const auto level = read_value<std::string>(node["log_level"], "global.log_level")) {
        if (const auto parsed = parse_log_level(*level)) {
            config.log_level = *parsed;
        } else {
            spdlog::warn("service_config: unknown log_level '{}', using info", *level);
        }
    }
    if (const auto path = read_value<std::string>(node["log_path"], "global.log_path")) {
        config.log_path = *path;
    }
}

void parse_pipeline(const YAML::Node& node, PipelineOptions& options) {
    if (!node) {
        return;
    }
    EvaluatorOptions evaluator = options.evaluator;
    assign_if(evaluator.block_threshold, node["block_threshold"], "pipeline.block_threshold");
    assign_if(evaluator.warn_threshold, node["warn_threshold"], "pipeline.warn_threshold");
    assign_if(evaluator.fail_open, node["fail_open"], "pipeline.fail_open");

    const bool valid = evaluator.warn_threshold >= 0.0 &&
                       evaluator.warn_threshold <= evaluator.block_threshold &&
                       evaluator.block_threshold <= 1.0;
    if (valid) {
        options.evaluator = evaluator;
    } else {
        spdlog::warn("service_config: thresholds warn={} block={} invalid, using defaults",
                     evaluator.warn_threshold, evaluator.block_threshold);
        options.evaluator.fail_open = evaluator.fail_open;
    }
    if (options.evaluator.fail_open) {
        spdlog::warn("service_config: fail_open enabled, external capability errors will not block");
    }

    assign_timeout(options.classifier_timeout, node["classifier_timeout_ms"], "pipeline.classifier_timeout_ms");
    assign_timeout(options.model_timeout, node["model_timeout_ms"], "pipeline.model_timeout_ms");

    if (const auto max_bytes = read_value<long long>(node["max_input_bytes"], "pipeline.max_input_bytes")) {
        if (*max_bytes > 0) {
            options.max_input_bytes = static_cast<std::size_t>(*max_bytes);
        } else {
            spdlog::warn("service_config: max_input_bytes must be positive, using default {}",
                         options.max_input_bytes);
        }
    }
    assign_if(options.fingerprint_salt, node["fingerprint_salt"], "pipeline.fingerprint_salt");

    if (const auto threads = read_value<int>(node["worker_threads"], "pipeline.worker_threads")) {
        if (*threads > 0) {
            options.worker_threads = static_cast<std::size_t>(*threads);
        }
    }
}

void parse_matcher(const YAML::Node& node, ServiceConfig& config) {
    if (!node) {
        return;
    }
    if (const auto budget = read_value<long long>(node["rule_time_budget_ms"], "matcher.rule_time_budget_ms")) {
        if (*budget > 0) {
            config.pipeline.matcher.rule_time_budget = std::chrono::milliseconds{*budget};
        } else {
            spdlog::warn("service_config: rule_time_budget_ms must be positive, using default");
        }
    }
    if (const auto max_matches = read_value<long long>(node["max_matches_per_rule"], "matcher.max_matches_per_rule")) {
        if (*max_matches > 0) {
            config.pipeline.matcher.max_matches_per_rule = static_cast<std::size_t>(*max_matches);
        } else {
            spdlog::warn("service_config: max_matches_per_rule must be positive, using default");
        }
    }
    if (const auto max_mem = read_value<std::int64_t>(node["regex_max_mem"], "matcher.regex_max_mem")) {
        if (*max_mem > 0) {
            config.loader.regex_max_mem = *max_mem;
        } else {
            spdlog::warn("service_config: regex_max_mem must be positive, using default");
        }
    }
}

void parse_rulesets(const YAML::Node& node, const std::filesystem::path& base_dir, ServiceConfig& config) {
    if (!node) {
        return;
    }
    if (!node.IsSequence()) {
        spdlog::warn("service_config: 'rulesets' must be a list, ignoring");
        return;
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
        const YAML::Node entry = node[i];
        const auto path = entry.IsMap() ? read_value<std::string>(entry["path"], "rulesets.path")
                                        : std::nullopt;
        if (!path || path->empty()) {
            spdlog::warn("service_config: rulesets[{}] has no path, skipping", i);
            continue;
        }

        RulesetSource source{};
        source.path = *path;
        if (source.path.is_relative() && !base_dir.empty()) {
            source.path = base_dir / source.path;
        }
        assign_if(source.scope.country, entry["country"], "rulesets.country");
        assign_if(source.scope.language, entry["language"], "rulesets.language");
        assign_if(source.scope.domain, entry["domain"], "rulesets.domain");
        config.rulesets.push_back(std::move(source));
    }
}

void parse_classifier(const YAML::Node& node, ServiceConfig& config) {
    if (!node || !node["patterns"]) {
        return;
    }
    const YAML::Node patterns = node["patterns"];
    if (!patterns.IsSequence()) {
        spdlog::warn("service_config: 'classifier.patterns' must be a list, ignoring");
        return;
    }
    for (const auto& entry : patterns) {
        if (!entry.IsMap()) {
            continue;
        }
        HeuristicPattern pattern{};
        assign_if(pattern.label, entry["label"], "classifier.patterns.label");
        assign_if(pattern.pattern, entry["pattern"], "classifier.patterns.pattern");
        assign_if(pattern.score, entry["score"], "classifier.patterns.score");
        if (pattern.label.empty() || pattern.pattern.empty()) {
            spdlog::warn("service_config: classifier pattern without label or pattern, skipping");
            continue;
        }
        config.classifier_patterns.push_back(std::move(pattern));
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// ServiceConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<ServiceConfig, ConfigError>
ServiceConfigLoader::load(const std::filesystem::path& path) {
    std::error_code ec;
    const auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kFileNotFound,
            "config file not found: " + ec.message(),
            path.string()});
    }

    std::ifstream in(canonical);
    if (!in) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kFileNotFound, "cannot open config file", canonical.string()});
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto config = load_string(buffer.str(), canonical.parent_path());
    if (!config) {
        config.error().context = canonical.string();
        return config;
    }
    spdlog::info("service_config: loaded {} ({} rulesets, {} classifier patterns)",
                 canonical.string(), config->rulesets.size(), config->classifier_patterns.size());
    return config;
}

std::expected<ServiceConfig, ConfigError>
ServiceConfigLoader::load_string(std::string_view document, const std::filesystem::path& base_dir) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::ParserException& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kParseError,
            "YAML parse error at line " + std::to_string(e.mark.line + 1) +
                ", column " + std::to_string(e.mark.column + 1) + ": " + e.msg,
            "<string>"});
    }

    ServiceConfig config{};
    if (!root || root.IsNull()) {
        spdlog::warn("service_config: empty configuration, using defaults");
        return config;
    }
    if (!root.IsMap()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kSchemaError, "configuration root must be a mapping", "<string>"});
    }

    try {
        parse_global(root["global"], config);
        parse_pipeline(root["pipeline"], config.pipeline);
        parse_matcher(root["matcher"], config);

        if (const auto severity = root["severity"]; severity && severity["high_categories"]) {
            const auto high = severity["high_categories"];
            if (high.IsSequence()) {
                config.loader.high_severity_categories.clear();
                for (const auto& item : high) {
                    if (item.IsScalar()) {
                        config.loader.high_severity_categories.push_back(item.as<std::string>());
                    }
                }
            } else {
                spdlog::warn("service_config: 'severity.high_categories' must be a list, ignoring");
            }
        }

        parse_rulesets(root["rulesets"], base_dir, config);
        parse_classifier(root["classifier"], config);
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kSchemaError, std::string("invalid configuration: ") + e.what(), "<string>"});
    }

    return config;
}

void ServiceConfigLoader::apply_env_overrides(ServiceConfig& config) {
    if (const auto level = env_value("PROMPTGATE_LOG_LEVEL")) {
        if (const auto parsed = parse_log_level(*level)) {
            config.log_level = *parsed;
        } else {
            spdlog::warn("env PROMPTGATE_LOG_LEVEL: invalid value '{}', keeping configured level", *level);
        }
    }
    if (const auto path = env_value("PROMPTGATE_LOG_PATH")) {
        config.log_path = *path;
    }
}

std::filesystem::path ServiceConfigLoader::config_path_from_env() {
    return env_value("PROMPTGATE_CONFIG").value_or(kDefaultConfigPath);
}
