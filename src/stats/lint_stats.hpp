#pragma once

// ---------------------------------------------------------------------------
// lint_stats.hpp
//
// 린트 실행 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_file_scanned / on_file_failed:
//   워커 스레드에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   모든 워커가 끝난 뒤 호출하는 것을 전제로 하지만, 실행 중 호출해도
//   data race 는 없다 (필드 간 일관성은 보장하지 않음).
//
// [격리 원칙]
// - 통계 갱신 실패가 분석 결과로 전파되지 않도록 모든 갱신 메서드는
//   noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <span>

#include "analyzer/rule.hpp"  // Finding
#include "common/types.hpp"   // Severity

// ---------------------------------------------------------------------------
// LintStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   findings_by_severity: Severity 정수값(low=0 ... critical=3)을 인덱스로 쓴다.
// ---------------------------------------------------------------------------
struct LintStatsSnapshot {
    std::uint64_t                    files_scanned{0};
    std::uint64_t                    files_failed{0};
    std::uint64_t                    statements{0};
    std::uint64_t                    findings_total{0};
    std::array<std::uint64_t, 4>     findings_by_severity{};
    int                              max_risk_score{0};
    std::chrono::milliseconds        elapsed{0};

    [[nodiscard]] std::uint64_t findings_of(Severity sev) const noexcept {
        return findings_by_severity[static_cast<std::size_t>(sev)];
    }
};

// ---------------------------------------------------------------------------
// LintStats
// ---------------------------------------------------------------------------
class LintStats {
public:
    LintStats() noexcept
        : started_at_(std::chrono::steady_clock::now())
    {}

    ~LintStats() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    LintStats(const LintStats&)            = delete;
    LintStats& operator=(const LintStats&) = delete;
    LintStats(LintStats&&)                 = delete;
    LintStats& operator=(LintStats&&)      = delete;

    // on_file_scanned
    //   파일 하나의 분석이 끝났을 때 호출 (워커 스레드).
    void on_file_scanned(std::size_t statements,
                         std::span<const Finding> findings,
                         int risk_score) noexcept {
        files_scanned_.fetch_add(1, std::memory_order_relaxed);
        statements_.fetch_add(statements, std::memory_order_relaxed);
        findings_total_.fetch_add(findings.size(), std::memory_order_relaxed);
        for (const auto& f : findings) {
            by_severity_[static_cast<std::size_t>(f.severity)].fetch_add(
                1, std::memory_order_relaxed);
        }

        // max 갱신: CAS 루프
        int current = max_risk_score_.load(std::memory_order_relaxed);
        while (risk_score > current
               && !max_risk_score_.compare_exchange_weak(current, risk_score,
                                                         std::memory_order_relaxed)) {
        }
    }

    // on_file_failed
    //   파일 읽기 실패 시 호출 (워커 스레드).
    void on_file_failed() noexcept {
        files_failed_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] LintStatsSnapshot snapshot() const noexcept {
        LintStatsSnapshot snap{};
        snap.files_scanned  = files_scanned_.load(std::memory_order_relaxed);
        snap.files_failed   = files_failed_.load(std::memory_order_relaxed);
        snap.statements     = statements_.load(std::memory_order_relaxed);
        snap.findings_total = findings_total_.load(std::memory_order_relaxed);
        for (std::size_t i = 0; i < by_severity_.size(); ++i) {
            snap.findings_by_severity[i] = by_severity_[i].load(std::memory_order_relaxed);
        }
        snap.max_risk_score = max_risk_score_.load(std::memory_order_relaxed);
        snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
        return snap;
    }

private:
    std::atomic<std::uint64_t>                files_scanned_{0};
    std::atomic<std::uint64_t>                files_failed_{0};
    std::atomic<std::uint64_t>                statements_{0};
    std::atomic<std::uint64_t>                findings_total_{0};
    std::array<std::atomic<std::uint64_t>, 4> by_severity_{};
    std::atomic<int>                          max_risk_score_{0};
    std::chrono::steady_clock::time_point     started_at_;
};
