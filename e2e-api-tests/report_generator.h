#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "benchmark_stats.h"

using json = nlohmann::json;

struct ReportMetadata {
    std::string test_run_id;
    std::string timestamp;
    std::string test_mode;
    std::string base_url;
    std::string platform;
    std::string platform_version;
    std::string cpu_model;
    double total_memory_gb = 0.0;
    int concurrency = 1;

    json to_json() const;
};

class ReportGenerator {
public:
    ReportGenerator();

    // Set report data
    void SetMetadata(const ReportMetadata& metadata);
    void SetResults(const std::vector<TestResult>& results);
    void SetBenchmarkStats(const BenchmarkStats& stats);
    void SetCategoryStats(const std::map<std::string, CategoryStats>& categories);

    // Generate report
    json GenerateJSON() const;
    bool SaveJSON(const std::string& filepath) const;

private:
    ReportMetadata metadata_;
    std::vector<TestResult> results_;
    BenchmarkStats stats_;
    std::map<std::string, CategoryStats> category_stats_;

    json BuildSummary() const;
    json BuildFailures() const;
    json BuildRequests() const;
    json BuildStatusHistogram() const;
};
