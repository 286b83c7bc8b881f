#include "classifier/heuristic_classifier.hpp"
#include "classifier/loopback_model.hpp"
#include "config/service_config.hpp"
#include "logger/structured_logger.hpp"
#include "pipeline/pipeline.hpp"
#include "policy/rule_registry.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

namespace {

// ---------------------------------------------------------------------------
// Helper: 명령행 인자 (--country CC --language LL --domain D)
// ---------------------------------------------------------------------------
std::optional<Scope> parse_scope_args(int argc, char* argv[]) {
    Scope scope{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            spdlog::error("missing value for {}", arg);
            return std::nullopt;
        }
        if (arg == "--country") {
            scope.country = argv[++i];
        } else if (arg == "--language") {
            scope.language = argv[++i];
        } else if (arg == "--domain") {
            scope.domain = argv[++i];
        } else {
            spdlog::error("unknown argument '{}'", arg);
            return std::nullopt;
        }
    }
    return scope;
}

void print_usage() {
    std::cerr << "usage: promptgate [--country CC] [--language LL] [--domain D]\n"
                 "  reads one request per line from stdin, writes one JSON response per line.\n"
                 "  env: PROMPTGATE_CONFIG, PROMPTGATE_LOG_LEVEL, PROMPTGATE_LOG_PATH\n";
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// ---------------------------------------------------------------------------
// StdinLineReader
//   poll() 로 200ms 마다 stop 플래그를 확인하며 stdin 을 줄 단위로 읽는다.
//   종료 시그널을 받으면 입력 대기 중이라도 빠져나온다.
// ---------------------------------------------------------------------------
class StdinLineReader {
public:
    explicit StdinLineReader(const std::atomic<bool>& stop) : stop_(stop) {}

    std::optional<std::string> next() {
        while (true) {
            if (const auto pos = buffer_.find('\n'); pos != std::string::npos) {
                std::string line = buffer_.substr(0, pos);
                buffer_.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return line;
            }
            if (eof_ || stop_.load()) {
                if (!eof_ || buffer_.empty()) {
                    return std::nullopt;
                }
                std::string rest = std::move(buffer_);
                buffer_.clear();
                return rest;
            }

            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            const int ready = ::poll(&pfd, 1, 200);
            if (ready <= 0) {
                continue;  // timeout 또는 EINTR → stop 플래그 재확인
            }

            char      chunk[4096];
            const auto n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n <= 0) {
                eof_ = true;
                continue;
            }
            buffer_.append(chunk, static_cast<std::size_t>(n));
        }
    }

private:
    const std::atomic<bool>& stop_;
    std::string              buffer_;
    bool                     eof_{false};
};

// ---------------------------------------------------------------------------
// Helper: 응답 JSON 한 줄
// ---------------------------------------------------------------------------
std::string format_response(const PipelineResponse& response) {
    std::ostringstream json;
    json << R"({"correlation_id":")" << escape_json_string(response.audit.correlation_id)
         << R"(","status":")" << to_string(response.decision.status)
         << R"(","state":")" << to_string(response.state)
         << R"(","sanitized_input":")" << escape_json_string(response.sanitized_input)
         << R"(","output":)";
    if (response.output_text) {
        json << '"' << escape_json_string(*response.output_text) << '"';
    } else {
        json << "null";
    }
    json << R"(,"explanation":")" << escape_json_string(response.decision.explanation)
         << R"(","reasons":[)";
    for (std::size_t i = 0; i < response.decision.reasons.size(); ++i) {
        const auto& reason = response.decision.reasons[i];
        json << (i > 0 ? "," : "") << R"({"kind":")" << to_string(reason.kind)
             << R"(","ref":")" << escape_json_string(reason.ref) << R"("})";
    }
    json << R"(],"triggers":[)";
    for (std::size_t i = 0; i < response.triggers.size(); ++i) {
        const auto& trigger = response.triggers[i];
        json << (i > 0 ? "," : "") << R"({"rule_id":")" << escape_json_string(trigger.rule_id)
             << R"(","category":")" << escape_json_string(trigger.category) << R"("})";
    }
    json << "]}";
    return json.str();
}

ReloadLog to_reload_log(const ReloadReport& report) {
    ReloadLog entry{};
    entry.activated     = report.activated;
    entry.kept_previous = report.kept_previous;
    entry.rule_errors   = report.rule_errors.size();
    entry.timestamp     = std::chrono::system_clock::now();
    for (const auto& error : report.config_errors) {
        entry.errors.push_back(error.context + ": " + error.message);
    }
    return entry;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // 진단 로그는 stderr 로 (stdout 은 응답 전용)
    spdlog::set_default_logger(spdlog::stderr_color_mt("promptgate-diag"));

    const auto scope = parse_scope_args(argc, argv);
    if (!scope) {
        print_usage();
        return EXIT_FAILURE;
    }

    // ── 설정 로드 (환경변수 > YAML > 기본값) ─────────────────────────────
    const auto config_path = ServiceConfigLoader::config_path_from_env();
    auto config = ServiceConfigLoader::load(config_path);
    if (!config) {
        spdlog::error("configuration error ({}): {}", config.error().context, config.error().message);
        return EXIT_FAILURE;
    }
    ServiceConfigLoader::apply_env_overrides(*config);
    spdlog::set_level(to_spdlog_level(config->log_level));

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    std::shared_ptr<StructuredLogger> audit_logger;
    try {
        audit_logger = std::make_shared<StructuredLogger>(config->log_level, config->log_path, false);
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Starting promptgate");
    spdlog::info("Config: {}", config_path.string());
    spdlog::info("Audit log: {}", config->log_path.string());
    spdlog::info("Scope: country='{}' language='{}' domain='{}'",
                 scope->country, scope->language, scope->domain);

    // ── RuleSet 로드 ────────────────────────────────────────────────────
    auto stats = std::make_shared<StatsCollector>();
    RuleRegistry registry{config->loader};
    const auto initial = registry.load_all(config->rulesets);
    audit_logger->log_reload(to_reload_log(initial));
    if (registry.size() == 0) {
        spdlog::error("no ruleset could be activated, every request will be blocked");
    }

    // ── capability / Pipeline ──────────────────────────────────────────
    const auto& patterns = config->classifier_patterns.empty()
                         ? HeuristicClassifier::default_patterns()
                         : config->classifier_patterns;
    auto classifier = std::make_shared<HeuristicClassifier>(patterns, config->loader.regex_max_mem);
    auto model      = std::make_shared<LoopbackModel>();

    Pipeline pipeline{registry, classifier, model, config->pipeline, audit_logger, stats};

    // ── 시그널: SIGHUP → reload, SIGINT/SIGTERM → 종료 ─────────────────
    std::atomic<bool>       stop_requested{false};
    boost::asio::io_context ioc;

    boost::asio::signal_set signals_stop{ioc, SIGTERM, SIGINT};
    signals_stop.async_wait([&](const boost::system::error_code& ec, int /*signum*/) {
        if (!ec) {
            spdlog::info("shutdown signal received");
            stop_requested.store(true);
            ioc.stop();
        }
    });

    boost::asio::signal_set signals_hup{ioc, SIGHUP};
    // SIGHUP 핸들러: 수신 후 재등록하여 반복 감지
    std::function<void()> wait_hup;
    wait_hup = [&]() {
        signals_hup.async_wait([&](const boost::system::error_code& ec, int /*signum*/) {
            if (ec) {
                return;
            }
            spdlog::info("SIGHUP received, reloading rulesets");
            const auto report = registry.reload_all();
            stats->on_reload(report.config_errors.empty());
            audit_logger->log_reload(to_reload_log(report));
            wait_hup();
        });
    };
    wait_hup();

    std::thread signal_thread([&ioc]() { ioc.run(); });

    // ── 요청 루프 ───────────────────────────────────────────────────────
    StdinLineReader reader{stop_requested};
    while (auto line = reader.next()) {
        if (line->empty()) {
            continue;
        }
        const auto response = pipeline.process(PipelineRequest{std::move(*line), *scope, std::nullopt});
        std::cout << format_response(response) << '\n' << std::flush;
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    ioc.stop();
    signal_thread.join();

    audit_logger->log_stats(stats->snapshot());
    spdlog::info("promptgate stopped");

    return EXIT_SUCCESS;
}
