#include "voice_bridge/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_bridge {

namespace {

void render_counter(std::ostringstream& out,
                    const std::string& name,
                    const std::string& help,
                    const std::string& label,
                    const std::map<std::string, uint64_t>& series) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " counter\n";
    for (const auto& item : series) {
        out << name << "{" << label << "=\"" << item.first << "\"} " << item.second << "\n";
    }
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5,
                         0.75, 1.0, 2.5, 5.0};
    webhook_latency_.buckets.assign(histogram_bounds_.size() + 1, 0);
}

void Metrics::increment_webhook_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++webhook_requests_total_;
}

void Metrics::observe_webhook_latency(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    webhook_latency_.count += 1;
    webhook_latency_.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            webhook_latency_.buckets[i] += 1;
        }
    }
    webhook_latency_.buckets.back() += 1;
}

void Metrics::session_started(const std::string& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_started_[channel];
}

void Metrics::session_ended(const std::string& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_ended_[channel];
}

void Metrics::barge_in(const std::string& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++barge_ins_[channel];
}

void Metrics::transcript_line(const std::string& sender) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++transcript_lines_[sender];
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP webhook_requests_total Total number of inbound call webhooks\n";
    out << "# TYPE webhook_requests_total counter\n";
    out << "webhook_requests_total " << webhook_requests_total_ << "\n";

    render_counter(out, "voice_sessions_started_total", "Voice sessions opened",
                   "channel", sessions_started_);
    render_counter(out, "voice_sessions_ended_total", "Voice sessions ended",
                   "channel", sessions_ended_);
    render_counter(out, "barge_in_total", "Playback clears caused by caller speech",
                   "channel", barge_ins_);
    render_counter(out, "transcript_lines_total", "Transcript lines recorded",
                   "sender", transcript_lines_);

    out << "# HELP webhook_response_seconds Inbound call webhook response time\n";
    out << "# TYPE webhook_response_seconds histogram\n";
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        out << "webhook_response_seconds_bucket{le=\"" << histogram_bounds_[i] << "\"} "
            << webhook_latency_.buckets[i] << "\n";
    }
    out << "webhook_response_seconds_bucket{le=\"+Inf\"} "
        << webhook_latency_.buckets.back() << "\n";
    out << "webhook_response_seconds_count " << webhook_latency_.count << "\n";
    out << "webhook_response_seconds_sum " << webhook_latency_.sum << "\n";

    return out.str();
}

}
