#include <chartkit/chartkit.hpp>
#include <chrono>
#include <thread>

using namespace chartkit;

int main()
{
    // Initialize logger with console output
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Also log to file
    Logger::instance().add_sink(sinks::file_sink("chartkit_example.log"));

    CHARTKIT_LOG_INFO("example", "Logger example starting up");

    CHARTKIT_LOG_TRACE("example", "This is a trace message");
    CHARTKIT_LOG_DEBUG("example", "Debug information: radius = {}", 70.0);
    CHARTKIT_LOG_WARN("example", "This is a warning message");

    CHARTKIT_LOG_DEBUG_HERE("example", "Logging with source location");

    // Degenerate input: each of these reports its fallback at Debug
    TimeSeries   empty;
    Distribution zeros = {{"FREE", 0}, {"BASIC", 0}};
    auto         path  = build_line_path(empty, 800, 200);
    auto         ring  = encode_donut(zeros);
    auto         idx   = sample_indices(12, 0);
    CHARTKIT_LOG_INFO("example",
                      "path '{}', {} segments, {} sampled indices",
                      path,
                      ring.size(),
                      idx.size());

    // Test thread safety
    auto worker = [](int id)
    {
        TimeSeries s;
        for (int i = 0; i < 5; ++i)
        {
            s.push_back({"2025-01-0" + std::to_string(i + 1), static_cast<double>(i * id)});
            CHARTKIT_LOG_DEBUG("worker", "Worker {} path {}", id, build_sparkline(s));
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);

    t1.join();
    t2.join();

    CHARTKIT_LOG_INFO("example", "Logger example completed");

    return 0;
}
