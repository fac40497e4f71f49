#include <catch2/catch.hpp>
#include "sfrest_tracing.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace sfrest;

namespace {

// Redirects std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_buf(std::cout.rdbuf(buffer.rdbuf())) { }
    ~CoutCapture() { std::cout.rdbuf(old_buf); }
    std::string Output() const { return buffer.str(); }

private:
    std::stringstream buffer;
    std::streambuf *old_buf;
};

void ResetTracer() {
    auto &tracer = SfrestTracer::Instance();
    tracer.SetEnabled(false);
    tracer.SetOutputMode("console");
    tracer.SetLevel(TraceLevel::INFO);
}

} // namespace

TEST_CASE("SfrestTracer Singleton Pattern", "[tracing]") {
    auto& instance1 = SfrestTracer::Instance();
    auto& instance2 = SfrestTracer::Instance();
    REQUIRE(&instance1 == &instance2);
}

TEST_CASE("SfrestTracer Basic Functionality", "[tracing]") {
    ResetTracer();
    auto& tracer = SfrestTracer::Instance();

    SECTION("Enable/Disable tracing") {
        tracer.SetEnabled(true);
        REQUIRE(tracer.IsEnabled());

        tracer.SetEnabled(false);
        REQUIRE_FALSE(tracer.IsEnabled());
    }

    SECTION("Set trace level") {
        tracer.SetLevel(TraceLevel::DEBUG_LEVEL);
        REQUIRE(tracer.GetLevel() == TraceLevel::DEBUG_LEVEL);

        tracer.SetLevel(TraceLevel::ERROR);
        REQUIRE(tracer.GetLevel() == TraceLevel::ERROR);
    }

    SECTION("Invalid output mode is rejected") {
        REQUIRE_THROWS_AS(tracer.SetOutputMode("syslog"), std::invalid_argument);
        REQUIRE(tracer.GetOutputMode() == "console");
    }
}

TEST_CASE("Trace level string conversion", "[tracing]") {
    REQUIRE(TraceLevelFromString("debug") == TraceLevel::DEBUG_LEVEL);
    REQUIRE(TraceLevelFromString("Trace") == TraceLevel::TRACE);
    REQUIRE(TraceLevelFromString("NONE") == TraceLevel::NONE);
    REQUIRE(TraceLevelToString(TraceLevel::DEBUG_LEVEL) == "DEBUG");
    REQUIRE(TraceLevelToString(TraceLevel::WARN) == "WARN");
    REQUIRE_THROWS_AS(TraceLevelFromString("verbose"), std::invalid_argument);
}

TEST_CASE("SfrestTracer Level Filtering", "[tracing]") {
    ResetTracer();
    auto& tracer = SfrestTracer::Instance();
    tracer.SetEnabled(true);

    SECTION("Messages at or below current level are logged") {
        CoutCapture capture;
        tracer.Error("TEST", "Error message");
        tracer.Warn("TEST", "Warning message");
        tracer.Info("TEST", "Info message");

        auto output = capture.Output();
        REQUIRE(output.find("[ERROR] [TEST] Error message") != std::string::npos);
        REQUIRE(output.find("[WARN] [TEST] Warning message") != std::string::npos);
        REQUIRE(output.find("[INFO] [TEST] Info message") != std::string::npos);
    }

    SECTION("Messages above current level are not logged") {
        CoutCapture capture;
        tracer.Debug("TEST", "Debug message");
        tracer.Trace("TEST", "Trace message");

        auto output = capture.Output();
        REQUIRE(output.find("Debug message") == std::string::npos);
        REQUIRE(output.find("Trace message") == std::string::npos);
    }

    SECTION("Disabled tracer logs nothing") {
        tracer.SetEnabled(false);
        CoutCapture capture;
        SFREST_TRACE_ERROR("TEST", "Swallowed");
        REQUIRE(capture.Output().empty());
    }

    ResetTracer();
}

TEST_CASE("SfrestTracer Data Messages", "[tracing]") {
    ResetTracer();
    auto& tracer = SfrestTracer::Instance();
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::DEBUG_LEVEL);

    CoutCapture capture;
    std::string test_data = R"({"Email":"ken@example.com"})";
    SFREST_TRACE_DEBUG_DATA("TEST", "Payload", test_data);

    auto output = capture.Output();
    REQUIRE(output.find("Payload") != std::string::npos);
    REQUIRE(output.find("Data: " + test_data) != std::string::npos);

    ResetTracer();
}

TEST_CASE("SfrestTracer File Output", "[tracing]") {
    ResetTracer();
    auto& tracer = SfrestTracer::Instance();

    std::string test_dir = "./sfrest_test_trace_output";
    std::filesystem::remove_all(test_dir);

    tracer.SetTraceDirectory(test_dir);
    REQUIRE(std::filesystem::exists(test_dir));

    tracer.SetOutputMode("file");
    tracer.SetEnabled(true);
    tracer.Info("TEST", "Written to file");
    tracer.SetEnabled(false);

    std::filesystem::path trace_file_path = std::filesystem::path(test_dir) / "sfrest_trace.log";
    REQUIRE(std::filesystem::exists(trace_file_path));

    std::ifstream file(trace_file_path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("[INFO] [TEST] Written to file") != std::string::npos);

    file.close();
    tracer.SetTraceDirectory(".");
    std::filesystem::remove_all(test_dir);
    ResetTracer();
}

TEST_CASE("SfrestTracer Thread Safety", "[tracing]") {
    ResetTracer();
    auto& tracer = SfrestTracer::Instance();
    tracer.SetEnabled(true);

    const int num_threads = 8;
    const int messages_per_thread = 50;
    std::atomic<int> total_messages(0);

    {
        CoutCapture capture;
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([&tracer, i, &total_messages]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    tracer.Info("THREAD_" + std::to_string(i), "Message " + std::to_string(j));
                    total_messages++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    REQUIRE(total_messages == num_threads * messages_per_thread);
    ResetTracer();
}
