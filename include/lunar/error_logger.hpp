#pragma once

#include <exception>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace lunar {

/**
 * ErrorLogger - appends timestamped error reports to a log file (Error.log
 * by default) and echoes them to stderr. Used for fatal heap exhaustion and
 * for script errors nobody recovered from.
 */
class ErrorLogger {
public:
    static ErrorLogger& instance() {
        static ErrorLogger inst;
        return inst;
    }

    void logError(const std::string& errorMessage,
                  const std::string& functionName = "",
                  const std::string& fileName = "",
                  int lineNumber = 0);

    // Script error with its traceback, innermost frame first.
    void logVmError(const std::string& errorMessage,
                    const std::string& currentFunction,
                    std::size_t lineNumber,
                    const std::vector<std::string>& callStack,
                    const std::string& additionalContext = "");

    void logException(const std::exception& ex,
                      const std::string& context = "");

    // Context items are attached to the next report and then cleared.
    void addContext(const std::string& key, const std::string& value);
    void clearContext();

    void setLogPath(const std::string& path);
    const std::string& logPath() const { return logPath_; }
    void setEchoToStderr(bool enabled) { echoToStderr_ = enabled; }

private:
    ErrorLogger() = default;
    ~ErrorLogger() = default;

    std::string getTimestamp() const;
    std::string header(const char* title) const;
    void appendContext(std::string& report, const char* title) const;
    void writeToFile(const std::string& content);

    std::mutex mutex_;
    std::string logPath_ = "Error.log";
    bool echoToStderr_{true};
    std::vector<std::pair<std::string, std::string>> contextItems_;
};

#define LUNAR_LOG_ERROR(msg) \
    lunar::ErrorLogger::instance().logError(msg, __FUNCTION__, __FILE__, __LINE__)

#define LUNAR_LOG_EXCEPTION(ex) \
    lunar::ErrorLogger::instance().logException(ex, std::string(__FUNCTION__) + " at " + __FILE__ + ":" + std::to_string(__LINE__))

} // namespace lunar
