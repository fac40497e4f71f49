#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iostream>

namespace sfrest {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

TraceLevel TraceLevelFromString(const std::string &level_str);
std::string TraceLevelToString(TraceLevel level);

class SfrestTracer {
public:
    static SfrestTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutputMode(const std::string& output_mode);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    std::string GetOutputMode() const { return output_mode; }
    std::string GetTraceDirectory() const { return trace_directory; }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

private:
    SfrestTracer() = default;
    ~SfrestTracer() = default;
    SfrestTracer(const SfrestTracer&) = delete;
    SfrestTracer& operator=(const SfrestTracer&) = delete;

    void Emit(const std::string& log_message);
    void OpenTraceFile();
    std::string GetTimestamp();

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    std::string trace_directory = ".";
    std::string output_mode = "console";
    std::unique_ptr<std::ofstream> trace_file;
    std::mutex trace_mutex;
};

#define SFREST_TRACE_ERROR(component, message) \
    ::sfrest::SfrestTracer::Instance().Error(component, message)

#define SFREST_TRACE_ERROR_DATA(component, message, data) \
    ::sfrest::SfrestTracer::Instance().Error(component, message, data)

#define SFREST_TRACE_WARN(component, message) \
    ::sfrest::SfrestTracer::Instance().Warn(component, message)

#define SFREST_TRACE_WARN_DATA(component, message, data) \
    ::sfrest::SfrestTracer::Instance().Warn(component, message, data)

#define SFREST_TRACE_INFO(component, message) \
    ::sfrest::SfrestTracer::Instance().Info(component, message)

#define SFREST_TRACE_INFO_DATA(component, message, data) \
    ::sfrest::SfrestTracer::Instance().Info(component, message, data)

#define SFREST_TRACE_DEBUG(component, message) \
    ::sfrest::SfrestTracer::Instance().Debug(component, message)

#define SFREST_TRACE_DEBUG_DATA(component, message, data) \
    ::sfrest::SfrestTracer::Instance().Debug(component, message, data)

#define SFREST_TRACE_TRACE(component, message) \
    ::sfrest::SfrestTracer::Instance().Trace(component, message)

#define SFREST_TRACE_TRACE_DATA(component, message, data) \
    ::sfrest::SfrestTracer::Instance().Trace(component, message, data)

} // namespace sfrest
