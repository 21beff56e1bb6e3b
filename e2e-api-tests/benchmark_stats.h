#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Per-request timing metrics
struct CommandMetrics {
    std::string endpoint;              // "POST /api/element/find/{sessionId}"
    double latency_ms = 0.0;           // Time from send to response received
    int64_t request_size_bytes = 0;    // Size of JSON request body
    int64_t response_size_bytes = 0;   // Size of JSON response body
    long http_status = 0;
    bool success = false;
    std::string status;                // ActionStatus code if applicable
    std::string error_message;

    json to_json() const {
        return {
            {"endpoint", endpoint},
            {"latency_ms", latency_ms},
            {"request_size_bytes", request_size_bytes},
            {"response_size_bytes", response_size_bytes},
            {"http_status", http_status},
            {"success", success},
            {"status", status},
            {"error_message", error_message}
        };
    }
};

// Aggregated statistics
struct BenchmarkStats {
    // Latency stats (in milliseconds)
    double min_latency = 0.0;
    double max_latency = 0.0;
    double avg_latency = 0.0;
    double median_latency = 0.0;
    double p95_latency = 0.0;          // 95th percentile
    double p99_latency = 0.0;          // 99th percentile
    double stddev_latency = 0.0;

    // Throughput
    double commands_per_second = 0.0;
    double bytes_per_second = 0.0;

    // Totals
    int total_commands = 0;
    int successful_commands = 0;
    int failed_commands = 0;
    double total_duration_sec = 0.0;

    json to_json() const {
        return {
            {"min_ms", min_latency},
            {"max_ms", max_latency},
            {"avg_ms", avg_latency},
            {"median_ms", median_latency},
            {"p95_ms", p95_latency},
            {"p99_ms", p99_latency},
            {"stddev_ms", stddev_latency}
        };
    }
};

// Category statistics
struct CategoryStats {
    std::string name;
    int total = 0;
    int passed = 0;
    int failed = 0;
    double avg_latency_ms = 0.0;
    std::vector<double> latencies;

    json to_json() const {
        return {
            {"total", total},
            {"passed", passed},
            {"failed", failed},
            {"avg_latency_ms", avg_latency_ms}
        };
    }
};

// Test result structure
struct TestResult {
    std::string name;                  // Readable label for reports
    std::string http_method;
    std::string path;
    std::string category;
    bool success = false;
    double duration_ms = 0.0;
    json request;
    json response;
    std::string error;
    std::string expected_status;
    std::string actual_status;
    CommandMetrics metrics;
};
