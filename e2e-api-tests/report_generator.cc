#include "report_generator.h"
#include <fstream>
#include <iomanip>

json ReportMetadata::to_json() const {
    return {
        {"test_run_id", test_run_id},
        {"timestamp", timestamp},
        {"test_mode", test_mode},
        {"base_url", base_url},
        {"platform", platform},
        {"platform_version", platform_version},
        {"cpu_model", cpu_model},
        {"total_memory_gb", total_memory_gb},
        {"concurrency", concurrency}
    };
}

ReportGenerator::ReportGenerator() {}

void ReportGenerator::SetMetadata(const ReportMetadata& metadata) {
    metadata_ = metadata;
}

void ReportGenerator::SetResults(const std::vector<TestResult>& results) {
    results_ = results;
}

void ReportGenerator::SetBenchmarkStats(const BenchmarkStats& stats) {
    stats_ = stats;
}

void ReportGenerator::SetCategoryStats(const std::map<std::string, CategoryStats>& categories) {
    category_stats_ = categories;
}

json ReportGenerator::BuildSummary() const {
    int passed = 0, failed = 0;
    for (const auto& r : results_) {
        if (r.success) passed++;
        else failed++;
    }

    return {
        {"total_tests", results_.size()},
        {"passed", passed},
        {"failed", failed},
        {"total_duration_sec", stats_.total_duration_sec},
        {"requests_per_second", stats_.commands_per_second},
        {"bytes_per_second", stats_.bytes_per_second}
    };
}

json ReportGenerator::BuildFailures() const {
    json failures = json::array();

    for (const auto& r : results_) {
        if (!r.success) {
            failures.push_back({
                {"method", r.http_method},
                {"path", r.path},
                {"body", r.request},
                {"expected", r.expected_status.empty() ? "success" : r.expected_status},
                {"actual", r.actual_status},
                {"http_status", r.metrics.http_status},
                {"message", r.error}
            });
        }
    }

    return failures;
}

json ReportGenerator::BuildRequests() const {
    json requests = json::array();

    for (const auto& r : results_) {
        requests.push_back({
            {"method", r.http_method},
            {"path", r.path},
            {"category", r.category},
            {"success", r.success},
            {"http_status", r.metrics.http_status},
            {"latency_ms", r.metrics.latency_ms},
            {"request_size_bytes", r.metrics.request_size_bytes},
            {"response_size_bytes", r.metrics.response_size_bytes},
            {"status", r.actual_status}
        });
    }

    return requests;
}

// Count of responses per ActionStatus code
json ReportGenerator::BuildStatusHistogram() const {
    std::map<std::string, int> counts;
    for (const auto& r : results_) {
        counts[r.actual_status]++;
    }
    json histogram = json::object();
    for (const auto& [status, count] : counts) {
        histogram[status] = count;
    }
    return histogram;
}

json ReportGenerator::GenerateJSON() const {
    json by_category = json::object();
    for (const auto& [name, cat] : category_stats_) {
        by_category[name] = cat.to_json();
    }

    return {
        {"metadata", metadata_.to_json()},
        {"summary", BuildSummary()},
        {"latency_stats", stats_.to_json()},
        {"by_category", by_category},
        {"by_status", BuildStatusHistogram()},
        {"requests", BuildRequests()},
        {"failures", BuildFailures()}
    };
}

bool ReportGenerator::SaveJSON(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << std::setw(2) << GenerateJSON() << std::endl;
    return true;
}
