#pragma once

#include <string>
#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <chrono>
#include "constants.h"

namespace scriptbox {

// Per-IP execution quota: concurrent runs, runs per hour and CPU seconds
// consumed over a sliding one-minute window
class RateLimiter {
public:
    struct Config {
        double cpu_seconds_per_minute;
        int max_concurrent_jobs;
        int max_jobs_per_hour;
        int cleanup_after_minutes;

        Config() :
            cpu_seconds_per_minute(CPU_SECONDS_PER_MINUTE),
            max_concurrent_jobs(MAX_CONCURRENT_JOBS_PER_IP),
            max_jobs_per_hour(MAX_JOBS_PER_HOUR),
            cleanup_after_minutes(RATE_LIMIT_CLEANUP_MINUTES) {}
    };

    struct QuotaInfo {
        double cpu_seconds_used = 0;
        double cpu_seconds_available = 0;
        int active_jobs = 0;
        int jobs_this_hour = 0;
        bool can_submit = false;
        std::string reason;
    };

    explicit RateLimiter(const Config& config = Config());

    // Check if IP can start another execution
    QuotaInfo check_quota(const std::string& ip);

    // Re-checks the quota and records the start atomically.
    // False if the IP is over quota (or job_id is already active).
    bool register_job_start(const std::string& ip, const std::string& job_id);

    // Record completion with the CPU time it consumed
    void register_job_end(const std::string& ip, const std::string& job_id, double cpu_seconds);

    // Drop IPs idle for longer than cleanup_after_minutes
    void cleanup_old_entries();

    size_t tracked_ips() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct IpState {
        std::deque<std::pair<TimePoint, double>> cpu_usage_history;
        std::set<std::string> active_jobs;
        std::deque<TimePoint> job_submissions;
        TimePoint last_seen;
    };

    Config config_;
    mutable std::mutex mutex_;
    std::map<std::string, IpState> ip_states_;

    QuotaInfo evaluate(IpState& state, const TimePoint& now) const;
    void cleanup_ip_history(IpState& state, const TimePoint& now) const;
};

} // namespace scriptbox
