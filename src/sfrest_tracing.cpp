#include "sfrest_tracing.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sfrest {

TraceLevel TraceLevelFromString(const std::string &level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "NONE") {
        return TraceLevel::NONE;
    } else if (upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (upper == "WARN") {
        return TraceLevel::WARN;
    } else if (upper == "INFO") {
        return TraceLevel::INFO;
    } else if (upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (upper == "TRACE") {
        return TraceLevel::TRACE;
    }

    throw std::invalid_argument("Invalid trace level: " + level_str +
                                ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string TraceLevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

SfrestTracer& SfrestTracer::Instance() {
    static SfrestTracer instance;
    return instance;
}

void SfrestTracer::SetEnabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->enabled = enabled;

        if (!enabled && trace_file) {
            trace_file->close();
            trace_file.reset();
        }
    }
    if (enabled) {
        Info("TRACER", "Tracing enabled, output mode: " + output_mode);
    }
}

void SfrestTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + TraceLevelToString(level));
}

void SfrestTracer::SetTraceDirectory(const std::string& directory) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace_directory = directory.empty() ? "." : directory;

        std::filesystem::path dir_path(trace_directory);
        if (!std::filesystem::exists(dir_path)) {
            std::filesystem::create_directories(dir_path);
        }

        // Reopened lazily on the next file write
        if (trace_file) {
            trace_file->close();
            trace_file.reset();
        }
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void SfrestTracer::SetOutputMode(const std::string& output_mode) {
    if (output_mode != "console" && output_mode != "file" && output_mode != "both") {
        throw std::invalid_argument("Invalid trace output: " + output_mode + ". Valid outputs are: console, file, both");
    }
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->output_mode = output_mode;
    }
    Info("TRACER", "Trace output mode set to: " + output_mode);
}

void SfrestTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    Trace(msg_level, component, message, std::string());
}

void SfrestTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!enabled || msg_level > level) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += TraceLevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    Emit(log_message);
}

void SfrestTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void SfrestTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void SfrestTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void SfrestTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void SfrestTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void SfrestTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void SfrestTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void SfrestTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void SfrestTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void SfrestTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void SfrestTracer::Emit(const std::string& log_message) {
    std::lock_guard<std::mutex> lock(trace_mutex);

    if (output_mode == "console" || output_mode == "both") {
        std::cout << log_message << std::endl;
    }

    if (output_mode == "file" || output_mode == "both") {
        if (!trace_file) {
            OpenTraceFile();
        }
        if (trace_file && trace_file->is_open()) {
            *trace_file << log_message << std::endl;
            trace_file->flush();
        }
    }
}

void SfrestTracer::OpenTraceFile() {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= "sfrest_trace.log";

    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path.string() << std::endl;
    }
}

std::string SfrestTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t));

    std::ostringstream timestamp;
    timestamp << time_buffer << "." << std::setw(3) << std::setfill('0') << ms.count();
    return timestamp.str();
}

} // namespace sfrest
