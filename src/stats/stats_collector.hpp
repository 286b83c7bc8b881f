#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 파이프라인 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request / on_match_errors / on_external_failure / on_audit_write_failure:
//   요청 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   조회 경로에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 요청 처리 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

#include "policy/compliance_evaluator.hpp"  // DecisionStatus

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   rps       : 수집기 생성 이후 평균 초당 요청 수
//   block_rate: blocked / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_requests{0};
    std::uint64_t                         allowed{0};
    std::uint64_t                         masked{0};
    std::uint64_t                         warned{0};
    std::uint64_t                         blocked{0};
    std::uint64_t                         match_errors{0};
    std::uint64_t                         external_failures{0};
    std::uint64_t                         audit_write_failures{0};
    std::uint64_t                         reloads{0};
    std::uint64_t                         reload_failures{0};
    double                                rps{0.0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : started_at_(std::chrono::steady_clock::now()) {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // on_request
    //   요청 하나의 최종 판정이 확정되었을 때 호출.
    void on_request(DecisionStatus status) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        switch (status) {
            case DecisionStatus::kAllow: allowed_.fetch_add(1, std::memory_order_relaxed); break;
            case DecisionStatus::kMask:  masked_.fetch_add(1, std::memory_order_relaxed);  break;
            case DecisionStatus::kWarn:  warned_.fetch_add(1, std::memory_order_relaxed);  break;
            case DecisionStatus::kBlock: blocked_.fetch_add(1, std::memory_order_relaxed); break;
        }
    }

    void on_match_errors(std::uint64_t count) noexcept {
        match_errors_.fetch_add(count, std::memory_order_relaxed);
    }

    void on_external_failure() noexcept {
        external_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    // 감사 기록 실패는 응답에 영향을 주지 않으므로 여기서만 드러난다
    void on_audit_write_failure() noexcept {
        audit_write_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_reload(bool all_succeeded) noexcept {
        reloads_.fetch_add(1, std::memory_order_relaxed);
        if (!all_succeeded) {
            reload_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto total   = total_requests_.load(std::memory_order_relaxed);
        const auto blocked = blocked_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_at_).count();

        double rps = 0.0;
        if (elapsed_sec > 0.0) {
            rps = static_cast<double>(total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_requests       = total,
            .allowed              = allowed_.load(std::memory_order_relaxed),
            .masked               = masked_.load(std::memory_order_relaxed),
            .warned               = warned_.load(std::memory_order_relaxed),
            .blocked              = blocked,
            .match_errors         = match_errors_.load(std::memory_order_relaxed),
            .external_failures    = external_failures_.load(std::memory_order_relaxed),
            .audit_write_failures = audit_write_failures_.load(std::memory_order_relaxed),
            .reloads              = reloads_.load(std::memory_order_relaxed),
            .reload_failures      = reload_failures_.load(std::memory_order_relaxed),
            .rps                  = rps,
            .block_rate           = block_rate,
            .captured_at          = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> allowed_{0};
    std::atomic<std::uint64_t> masked_{0};
    std::atomic<std::uint64_t> warned_{0};
    std::atomic<std::uint64_t> blocked_{0};
    std::atomic<std::uint64_t> match_errors_{0};
    std::atomic<std::uint64_t> external_failures_{0};
    std::atomic<std::uint64_t> audit_write_failures_{0};
    std::atomic<std::uint64_t> reloads_{0};
    std::atomic<std::uint64_t> reload_failures_{0};

    const std::chrono::steady_clock::time_point started_at_;
};
