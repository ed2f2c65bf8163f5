#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment_webhook_request();
    void observe_webhook_latency(double seconds);
    void session_started(const std::string& channel);
    void session_ended(const std::string& channel);
    void barge_in(const std::string& channel);
    void transcript_line(const std::string& sender);
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    uint64_t webhook_requests_total_ = 0;
    HistogramSeries webhook_latency_;
    std::map<std::string, uint64_t> sessions_started_;
    std::map<std::string, uint64_t> sessions_ended_;
    std::map<std::string, uint64_t> barge_ins_;
    std::map<std::string, uint64_t> transcript_lines_;
    std::vector<double> histogram_bounds_;
};

}
