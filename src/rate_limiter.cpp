#include "rate_limiter.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace scriptbox {

RateLimiter::RateLimiter(const Config& config) : config_(config) {}

void RateLimiter::cleanup_ip_history(IpState& state, const TimePoint& now) const {
    auto minute_ago = now - std::chrono::minutes(1);
    while (!state.cpu_usage_history.empty() &&
           state.cpu_usage_history.front().first < minute_ago) {
        state.cpu_usage_history.pop_front();
    }

    auto hour_ago = now - std::chrono::hours(1);
    while (!state.job_submissions.empty() && state.job_submissions.front() < hour_ago) {
        state.job_submissions.pop_front();
    }
}

RateLimiter::QuotaInfo RateLimiter::evaluate(IpState& state, const TimePoint& now) const {
    cleanup_ip_history(state, now);

    QuotaInfo info;
    for (const auto& [when, seconds] : state.cpu_usage_history) {
        info.cpu_seconds_used += seconds;
    }
    info.cpu_seconds_available = std::max(0.0, config_.cpu_seconds_per_minute - info.cpu_seconds_used);
    info.active_jobs = static_cast<int>(state.active_jobs.size());
    info.jobs_this_hour = static_cast<int>(state.job_submissions.size());

    if (info.active_jobs >= config_.max_concurrent_jobs) {
        info.reason = "Too many concurrent executions (max " +
                      std::to_string(config_.max_concurrent_jobs) + ")";
    } else if (info.jobs_this_hour >= config_.max_jobs_per_hour) {
        info.reason = "Hourly execution limit reached (max " +
                      std::to_string(config_.max_jobs_per_hour) + ")";
    } else if (info.cpu_seconds_available <= 0) {
        std::ostringstream msg;
        msg << "CPU quota exhausted (" << std::fixed << std::setprecision(1)
            << config_.cpu_seconds_per_minute << "s per minute)";
        info.reason = msg.str();
    } else {
        info.can_submit = true;
    }
    return info;
}

RateLimiter::QuotaInfo RateLimiter::check_quota(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    auto& state = ip_states_[ip];
    state.last_seen = now;
    return evaluate(state, now);
}

bool RateLimiter::register_job_start(const std::string& ip, const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    auto& state = ip_states_[ip];
    state.last_seen = now;
    if (!evaluate(state, now).can_submit || state.active_jobs.count(job_id)) {
        return false;
    }

    state.active_jobs.insert(job_id);
    state.job_submissions.push_back(now);
    return true;
}

void RateLimiter::register_job_end(const std::string& ip, const std::string& job_id,
                                   double cpu_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    auto it = ip_states_.find(ip);
    if (it == ip_states_.end()) {
        return;
    }

    auto& state = it->second;
    state.active_jobs.erase(job_id);
    if (cpu_seconds > 0) {
        state.cpu_usage_history.emplace_back(now, cpu_seconds);
    }
    state.last_seen = now;
}

void RateLimiter::cleanup_old_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto cutoff = now - std::chrono::minutes(config_.cleanup_after_minutes);

    for (auto it = ip_states_.begin(); it != ip_states_.end();) {
        if (it->second.active_jobs.empty() && it->second.last_seen < cutoff) {
            it = ip_states_.erase(it);
        } else {
            cleanup_ip_history(it->second, now);
            ++it;
        }
    }
}

size_t RateLimiter::tracked_ips() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ip_states_.size();
}

} // namespace scriptbox
