/**
 * @file profiler.hpp
 * @brief Per-category timing for render phases
 *
 * Thread-safe: tile workers record concurrently.
 */

#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <atomic>
#include <mutex>
#include <iostream>
#include <iomanip>
#include <vector>
#include <algorithm>
#include <cstdint>

namespace sunbeam {

/**
 * @brief Performance profiler with per-category timing
 *
 * Usage:
 *   Profiler::instance().record("Film Merge", Profiler::Duration(ms));
 *
 * Or use RAII:
 *   { ProfileScope scope("Tile Rendering"); ... }
 */
class Profiler {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double, std::milli>;

    struct Stats {
        std::atomic<uint64_t> total_ns{0};
        std::atomic<uint64_t> call_count{0};
    };

    static Profiler& instance() {
        static Profiler inst;
        return inst;
    }

    /**
     * @brief Drop all recorded categories
     */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.clear();
    }

    /**
     * @brief Record a timing manually (thread-safe)
     */
    void record(const std::string& category, Duration duration) {
        auto ns = static_cast<uint64_t>(std::max(0.0, duration.count()) * 1e6);
        Stats& stats = get_stats(category);
        stats.total_ns.fetch_add(ns, std::memory_order_relaxed);
        stats.call_count.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Number of records for a category (0 if never recorded)
     */
    uint64_t call_count(const std::string& category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stats_.find(category);
        return it == stats_.end() ? 0 : it->second.call_count.load();
    }

    double total_ms(const std::string& category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stats_.find(category);
        return it == stats_.end() ? 0.0 : it->second.total_ns.load() / 1e6;
    }

    /**
     * @brief Print a table of categories sorted by total time
     */
    void report(std::ostream& out = std::cout) const {
        std::lock_guard<std::mutex> lock(mutex_);

        if (stats_.empty()) {
            out << "Profiler: No data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, const Stats*>> sorted;
        for (const auto& [name, stats] : stats_) {
            sorted.emplace_back(name, &stats);
        }
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second->total_ns.load() > b.second->total_ns.load();
        });

        out << "\n===== RENDER PROFILE =====\n";
        out << std::left << std::setw(20) << "Category"
            << std::right << std::setw(12) << "Total (ms)"
            << std::setw(10) << "Calls"
            << std::setw(12) << "Avg (ms)" << "\n";
        out << std::string(54, '-') << "\n";

        for (const auto& [name, stats] : sorted) {
            uint64_t total_ns = stats->total_ns.load();
            uint64_t calls = stats->call_count.load();
            double total_ms = total_ns / 1e6;
            double avg_ms = calls > 0 ? total_ms / calls : 0.0;

            out << std::left << std::setw(20) << name
                << std::right << std::fixed << std::setprecision(1)
                << std::setw(12) << total_ms
                << std::setw(10) << calls
                << std::setprecision(3) << std::setw(12) << avg_ms << "\n";
        }
        out << std::string(54, '-') << "\n\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    Stats& get_stats(const std::string& category) {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_[category];
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Stats> stats_;
};

/**
 * @brief RAII scope timer
 */
class ProfileScope {
public:
    explicit ProfileScope(const char* category)
        : category_(category), start_(Profiler::Clock::now()) {}

    ~ProfileScope() {
        Profiler::Duration duration = Profiler::Clock::now() - start_;
        Profiler::instance().record(category_, duration);
    }

private:
    const char* category_;
    Profiler::Clock::time_point start_;
};

/**
 * @brief Simple one-shot timer for larger sections
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    Clock::time_point start_;
};

} // namespace sunbeam
