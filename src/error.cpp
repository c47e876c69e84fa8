#include "lunar/error.hpp"

namespace lunar {

ScriptError::ScriptError(Value value, const std::string& description)
    : std::runtime_error(description), value_(value) {}

std::vector<std::string> formatTraceback(const std::vector<TracebackEntry>& traceback) {
    std::vector<std::string> lines;
    lines.reserve(traceback.size());
    for (const auto& entry : traceback) {
        std::string line = entry.source.empty() ? "?" : entry.source;
        if (entry.line > 0) {
            line += ":" + std::to_string(entry.line);
        }
        line += ": in " + (entry.function.empty() ? std::string("?") : entry.function);
        lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace lunar
