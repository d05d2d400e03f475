/**
 * @file profile.hpp
 * @brief Scope timing for the simulation tick
 *
 * Each named scope accumulates call count, total time and worst-case time.
 * Scopes opened while another is active become its children, so the printed
 * summary mirrors the call structure of a tick:
 *
 * @code
 * void Simulator::tick() {
 *     PROFILE_SCOPE("Simulator::tick");
 *     ...
 * }
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    struct ProfileData {
        Duration total_time{0};
        Duration max_time{0};
        uint64_t call_count{0};
        std::string parent_name;
        std::vector<std::string> children;
    };

    static void startSection(const std::string& name);
    static void endSection(const std::string& name);

    /**
     * @brief Aggregated data for a scope, or nullptr if it never ran
     */
    static const ProfileData* getData(const std::string& name);

    /** @brief Print the scope tree with totals and per-call averages to stdout */
    static void printStats();

    static void reset();

private:
    struct OpenScope {
        std::string name;
        TimePoint start_time;
    };

    std::unordered_map<std::string, ProfileData> sections;
    std::vector<OpenScope> open_scopes;

    Profiler() = default;
    static Profiler& getInstance();

    static void printNode(const std::string& name, const std::string& prefix, bool is_last);
};

/**
 * @brief RAII guard that times the enclosing scope
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
