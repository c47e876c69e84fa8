#include "lunar/error_logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <typeinfo>

namespace lunar {

namespace {

constexpr const char* kRule =
    "================================================================================\n";

} // namespace

std::string ErrorLogger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string ErrorLogger::header(const char* title) const {
    std::string out = "\n";
    out += kRule;
    out += title;
    out += " - " + getTimestamp() + "\n";
    out += kRule;
    return out;
}

void ErrorLogger::appendContext(std::string& report, const char* title) const {
    if (contextItems_.empty()) {
        return;
    }
    report += "\n--- ";
    report += title;
    report += " ---\n";
    for (const auto& item : contextItems_) {
        report += item.first + ": " + item.second + "\n";
    }
}

void ErrorLogger::writeToFile(const std::string& content) {
    std::ofstream ofs(logPath_, std::ios::app);
    if (ofs.is_open()) {
        ofs << content;
        ofs.flush();
    }
    if (echoToStderr_) {
        std::cerr << content;
    }
}

void ErrorLogger::logError(const std::string& errorMessage,
                           const std::string& functionName,
                           const std::string& fileName,
                           int lineNumber) {
    std::scoped_lock lock(mutex_);
    std::string report = header("ERROR LOG");
    report += "Message: " + errorMessage + "\n";
    if (!functionName.empty()) {
        report += "Function: " + functionName + "\n";
    }
    if (!fileName.empty()) {
        report += "File: " + fileName + "\n";
    }
    if (lineNumber > 0) {
        report += "Line: " + std::to_string(lineNumber) + "\n";
    }
    appendContext(report, "Context");
    report += kRule;
    report += "\n";

    writeToFile(report);
    contextItems_.clear();
}

void ErrorLogger::logVmError(const std::string& errorMessage,
                             const std::string& currentFunction,
                             std::size_t lineNumber,
                             const std::vector<std::string>& callStack,
                             const std::string& additionalContext) {
    std::scoped_lock lock(mutex_);
    std::string report = header("VM ERROR LOG");
    report += "Message: " + errorMessage + "\n";
    report += "\n--- VM State ---\n";
    report += "Current Function: " + (currentFunction.empty() ? std::string("<main>") : currentFunction) + "\n";
    if (lineNumber > 0) {
        report += "Source Line: " + std::to_string(lineNumber) + "\n";
    } else {
        report += "Source Line: <unknown>\n";
    }

    if (!callStack.empty()) {
        report += "\n--- Script Call Stack ---\n";
        for (std::size_t i = 0; i < callStack.size(); ++i) {
            report += "  [" + std::to_string(i) + "] " + callStack[i] + "\n";
        }
    }

    if (!additionalContext.empty()) {
        report += "\n--- Additional Context ---\n";
        report += additionalContext + "\n";
    }
    appendContext(report, "Debug Context");
    report += kRule;
    report += "\n";

    writeToFile(report);
    contextItems_.clear();
}

void ErrorLogger::logException(const std::exception& ex,
                               const std::string& context) {
    std::scoped_lock lock(mutex_);
    std::string report = header("EXCEPTION LOG");
    report += std::string("Exception Type: ") + typeid(ex).name() + "\n";
    report += std::string("Message: ") + ex.what() + "\n";
    if (!context.empty()) {
        report += "Context: " + context + "\n";
    }
    appendContext(report, "Debug Context");
    report += kRule;
    report += "\n";

    writeToFile(report);
    contextItems_.clear();
}

void ErrorLogger::addContext(const std::string& key, const std::string& value) {
    std::scoped_lock lock(mutex_);
    contextItems_.emplace_back(key, value);
}

void ErrorLogger::clearContext() {
    std::scoped_lock lock(mutex_);
    contextItems_.clear();
}

void ErrorLogger::setLogPath(const std::string& path) {
    std::scoped_lock lock(mutex_);
    logPath_ = path;
}

} // namespace lunar
