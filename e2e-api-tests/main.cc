#include <iostream>
#include <string>
#include <cstring>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <uuid/uuid.h>
#include <sys/utsname.h>
#include <sys/sysinfo.h>
#include <curl/curl.h>
#include <thread>
#include <vector>
#include <atomic>

#include "api_client.h"
#include "test_runner.h"
#include "report_generator.h"
#include "api_tests.h"

// Generate UUID for test run
std::string GenerateUUID() {
    uuid_t uuid;
    uuid_generate(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

// Get current timestamp
std::string GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string GetPlatformVersion() {
    struct utsname info;
    if (uname(&info) == 0) {
        return std::string(info.release);
    }
    return "unknown";
}

std::string GetCPUModel() {
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo, line)) {
        if (line.find("model name") == 0) {
            size_t pos = line.find(':');
            if (pos != std::string::npos) {
                std::string model = line.substr(pos + 1);
                size_t start = model.find_first_not_of(" \t");
                if (start != std::string::npos) {
                    return model.substr(start);
                }
            }
        }
    }
    return "unknown";
}

double GetTotalMemoryGB() {
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return (static_cast<double>(info.totalram) * info.mem_unit) / (1024.0 * 1024.0 * 1024.0);
    }
    return 0.0;
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --base-url URL        Gateway address (default: http://127.0.0.1:8080)\n";
    std::cout << "  --test-url URL        Page for navigation and cookie tests (default: built-in fixture)\n";
    std::cout << "  --mode MODE           Test mode: smoke, full, benchmark, parallel\n";
    std::cout << "  --concurrency N       Number of parallel clients for parallel mode (default: 4)\n";
    std::cout << "  --iterations N        Number of iterations for benchmark mode (default: 10)\n";
    std::cout << "  --verbose             Enable verbose output\n";
    std::cout << "  --json-report FILE    Output JSON report to file\n";
    std::cout << "  --help                Show this help message\n";
    std::cout << "\n";
    std::cout << "Parallel Mode:\n";
    std::cout << "  Each client opens its own session and runs the smoke sequence concurrently.\n";
    std::cout << "  Sessions are independent, so throughput should scale with the gateway's workers.\n";
}

// Smoke sequence on a private session
bool RunSmokeSequence(ApiClient& client, const std::string& test_url, int thread_id, bool verbose) {
    auto init = client.Get("/api/session/initialize");
    if (!ResponseValidator::ValidateSessionId(init)) {
        if (verbose) {
            std::cerr << "[Thread " << thread_id << "] Failed to start session: "
                      << ResponseValidator::GetMessage(init) << std::endl;
        }
        return false;
    }
    std::string sid = init["sessionId"].get<std::string>();

    bool ok = ResponseValidator::IsSuccess(client.Post("/api/navigation/to/" + sid, {{"url", test_url}})) &&
              ResponseValidator::IsSuccess(client.Get("/api/navigation/title/" + sid)) &&
              ResponseValidator::IsSuccess(client.Post("/api/element/find/" + sid,
                  {{"locatorType", "css"}, {"locatorValue", "body"}})) &&
              ResponseValidator::ValidateBase64Image(client.Get("/api/script/screenshot/" + sid));

    auto closed = client.Get("/api/session/close/" + sid);
    if (verbose) {
        std::cerr << "[Thread " << thread_id << "] " << (ok ? "Completed" : "Failed")
                  << " session " << sid << std::endl;
    }
    return ok && ResponseValidator::IsSuccess(closed);
}

int main(int argc, char* argv[]) {
    // Default options
    std::string base_url = "http://127.0.0.1:8080";
    std::string test_url;
    std::string mode = "full";
    bool verbose = false;
    std::string json_report_path;
    int iterations = 10;
    int concurrency = 4;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--base-url") == 0 && i + 1 < argc) {
            base_url = argv[++i];
        } else if (strcmp(argv[i], "--test-url") == 0 && i + 1 < argc) {
            test_url = argv[++i];
        } else if (strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode = argv[++i];
        } else if (strcmp(argv[i], "--concurrency") == 0 && i + 1 < argc) {
            concurrency = std::stoi(argv[++i]);
            if (concurrency < 1) concurrency = 1;
        } else if (strcmp(argv[i], "--iterations") == 0 && i + 1 < argc) {
            iterations = std::stoi(argv[++i]);
            if (iterations < 1) iterations = 1;
        } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--json-report") == 0 && i + 1 < argc) {
            json_report_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            PrintUsage(argv[0]);
            return 3;
        }
    }

    if (test_url.empty()) {
        test_url = FixturePageUrl();
    }

    std::cout << "========================================\n";
    std::cout << "KITE GATEWAY API TEST CLIENT\n";
    std::cout << "========================================\n";
    std::cout << "Gateway:    " << base_url << "\n";
    std::cout << "Mode:       " << mode << "\n";
    if (mode == "parallel") {
        std::cout << "Concurrency: " << concurrency << " clients\n";
    }
    std::cout << "URL:        " << (test_url.size() > 60 ? test_url.substr(0, 57) + "..." : test_url) << "\n";
    std::cout << "========================================\n\n";

    curl_global_init(CURL_GLOBAL_DEFAULT);

    ApiClient client(base_url);
    client.SetVerbose(verbose);

    if (!client.IsReachable()) {
        std::cerr << "[FATAL] Gateway is not reachable at " << base_url << std::endl;
        curl_global_cleanup();
        return 2;
    }
    std::cout << "[INFO] Gateway reachable" << std::endl;

    TestRunner runner(client);
    runner.SetVerbose(verbose);

    bool all_passed = true;

    if (mode == "smoke") {
        std::cout << "\n[INFO] Running smoke tests...\n" << std::endl;

        auto init = client.Get("/api/session/initialize");
        if (ResponseValidator::ValidateSessionId(init)) {
            std::string sid = init["sessionId"].get<std::string>();
            runner.SetActiveSession(sid);

            runner.Test("POST", "/api/navigation/to/" + sid, {{"url", test_url}}, "smoke");
            runner.Test("GET", "/api/navigation/title/" + sid, json(), "smoke");
            runner.Test("POST", "/api/element/find/" + sid,
                        {{"locatorType", "css"}, {"locatorValue", "body"}}, "smoke");
            runner.Test("GET", "/api/script/screenshot/" + sid, json(), "smoke");
            runner.Test("GET", "/api/session/close/" + sid, json(), "smoke");
        } else {
            std::cerr << "[ERROR] Failed to start session: " << ResponseValidator::GetStatus(init)
                      << " - " << ResponseValidator::GetMessage(init) << std::endl;
            all_passed = false;
        }

        all_passed = runner.PrintSummary() && all_passed;
    }
    else if (mode == "full") {
        all_passed = RunAllApiTests(runner, client, test_url);
    }
    else if (mode == "parallel") {
        std::cout << "\n[INFO] Running parallel test with " << concurrency << " clients...\n" << std::endl;

        std::atomic<int> passed{0};
        std::atomic<int> failed{0};
        std::vector<std::thread> threads;

        auto start = std::chrono::steady_clock::now();

        for (int i = 0; i < concurrency; i++) {
            threads.emplace_back([&base_url, &test_url, &passed, &failed, i, verbose]() {
                ApiClient thread_client(base_url);
                if (RunSmokeSequence(thread_client, test_url, i, verbose)) {
                    passed++;
                } else {
                    failed++;
                }
            });
        }

        for (auto& t : threads) {
            t.join();
        }

        auto end = std::chrono::steady_clock::now();
        double duration_sec = std::chrono::duration<double>(end - start).count();

        std::cout << "\n========================================\n";
        std::cout << "PARALLEL TEST SUMMARY\n";
        std::cout << "========================================\n";
        std::cout << "Clients:      " << concurrency << "\n";
        std::cout << "Passed:       " << passed.load() << "\n";
        std::cout << "Failed:       " << failed.load() << "\n";
        std::cout << "Duration:     " << std::fixed << std::setprecision(2) << duration_sec << "s\n";
        std::cout << "Throughput:   " << std::setprecision(1) << (concurrency / duration_sec) << " sessions/s\n";
        std::cout << "========================================\n";

        all_passed = (failed.load() == 0);
    }
    else if (mode == "benchmark") {
        std::cout << "\n[INFO] Running benchmark (" << iterations << " iterations)...\n" << std::endl;

        auto init = client.Get("/api/session/initialize");
        if (ResponseValidator::ValidateSessionId(init)) {
            std::string sid = init["sessionId"].get<std::string>();
            runner.SetActiveSession(sid);

            client.Post("/api/navigation/to/" + sid, {{"url", test_url}});

            for (int i = 0; i < iterations; i++) {
                runner.Test("GET", "/api/navigation/url/" + sid, json(), "benchmark");
                runner.Test("GET", "/api/navigation/title/" + sid, json(), "benchmark");
                runner.Test("POST", "/api/element/find/" + sid,
                            {{"locatorType", "css"}, {"locatorValue", "body"}}, "benchmark");
                runner.Test("POST", "/api/script/execute/" + sid,
                            {{"script", "return document.readyState;"}}, "benchmark");
                runner.Test("GET", "/api/script/screenshot/" + sid, json(), "benchmark");
            }

            client.Get("/api/session/close/" + sid);
        } else {
            std::cerr << "[ERROR] Failed to start session" << std::endl;
            all_passed = false;
        }

        all_passed = runner.PrintSummary() && all_passed;
    }
    else {
        std::cerr << "Unknown mode: " << mode << std::endl;
        PrintUsage(argv[0]);
        curl_global_cleanup();
        return 3;
    }

    // Generate report
    if (!json_report_path.empty()) {
        std::cout << "\n[INFO] Generating report..." << std::endl;

        ReportMetadata metadata;
        metadata.test_run_id = GenerateUUID();
        metadata.timestamp = GetTimestamp();
        metadata.test_mode = mode;
        metadata.base_url = base_url;
        metadata.platform = "linux";
        metadata.platform_version = GetPlatformVersion();
        metadata.cpu_model = GetCPUModel();
        metadata.total_memory_gb = GetTotalMemoryGB();
        metadata.concurrency = mode == "parallel" ? concurrency : 1;

        ReportGenerator report_gen;
        report_gen.SetMetadata(metadata);
        report_gen.SetResults(runner.GetResults());
        report_gen.SetBenchmarkStats(runner.CalculateStats());
        report_gen.SetCategoryStats(runner.GetCategoryStats());

        if (report_gen.SaveJSON(json_report_path)) {
            std::cout << "[INFO] JSON report saved to: " << json_report_path << std::endl;
        } else {
            std::cerr << "[ERROR] Failed to save JSON report" << std::endl;
        }
    }

    curl_global_cleanup();

    std::cout << "\n========================================\n";
    std::cout << (all_passed ? "ALL TESTS PASSED" : "SOME TESTS FAILED") << "\n";
    std::cout << "========================================\n";

    return all_passed ? 0 : 1;
}
