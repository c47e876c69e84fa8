#include "lunar/chunk_io.hpp"
#include "lunar/error_logger.hpp"
#include "lunar/runtime.hpp"
#include "lunar/value_ops.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct RunnerOptions {
    std::int64_t fuelPerStep{10000};
    lunar::RuntimeOptions runtime;
    std::string chunkPath;
    std::vector<std::string> scriptArgs;
};

void printUsage() {
    std::cerr << "Usage: lunar [--fuel N] [--max-frames N] [--gc-slice N] [--max-objects N] <chunk.lbc> [args...]\n";
}

std::int64_t parseCount(const std::string& flag, const std::string& text) {
    std::size_t used = 0;
    const long long value = std::stoll(text, &used);
    if (used != text.size() || value <= 0) {
        throw std::invalid_argument(flag + " expects a positive integer, got '" + text + "'");
    }
    return value;
}

RunnerOptions parseArgs(int argc, char** argv) {
    RunnerOptions options;
    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            break;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + arg);
        }
        const std::int64_t value = parseCount(arg, argv[++i]);
        if (arg == "--fuel") {
            options.fuelPerStep = value;
        } else if (arg == "--max-frames") {
            options.runtime.maxFrames = static_cast<std::size_t>(value);
        } else if (arg == "--gc-slice") {
            options.runtime.gc.sliceBudgetObjects = static_cast<std::size_t>(value);
        } else if (arg == "--max-objects") {
            options.runtime.gc.maxObjects = static_cast<std::size_t>(value);
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    if (i >= argc) {
        throw std::invalid_argument("missing chunk file");
    }
    options.chunkPath = argv[i++];
    for (; i < argc; ++i) {
        options.scriptArgs.emplace_back(argv[i]);
    }
    return options;
}

void reportScriptError(const lunar::StepResult& result) {
    std::vector<std::string> callStack = lunar::formatTraceback(result.traceback);
    std::string function = "main chunk";
    std::size_t line = 0;
    if (!result.traceback.empty()) {
        function = result.traceback.front().function;
        line = static_cast<std::size_t>(result.traceback.front().line);
    }
    lunar::ErrorLogger::instance().logVmError(result.message, function, line, callStack);
}

} // namespace

int main(int argc, char** argv) {
    RunnerOptions options;
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "lunar: " << ex.what() << "\n";
        printUsage();
        return 64;
    }

    std::shared_ptr<const lunar::Prototype> chunk;
    try {
        chunk = lunar::loadChunkFile(options.chunkPath);
    } catch (const std::exception& ex) {
        std::cerr << "lunar: " << ex.what() << "\n";
        return 1;
    }

    try {
        lunar::Runtime runtime(options.runtime);
        const lunar::Value entry = runtime.load(chunk);

        std::vector<lunar::Value> args;
        for (const auto& text : options.scriptArgs) {
            args.push_back(runtime.createString(text));
        }

        auto executor = runtime.newExecutor(entry, std::move(args));
        lunar::StepResult result;
        do {
            result = executor->step(options.fuelPerStep);
        } while (result.status == lunar::StepStatus::Pending);

        if (result.status == lunar::StepStatus::Errored) {
            if (result.protocolViolation) {
                lunar::ErrorLogger::instance().addContext("chunk", options.chunkPath);
                lunar::ErrorLogger::instance().logError("protocol violation: " + result.message);
                return 2;
            }
            lunar::ErrorLogger::instance().addContext("chunk", options.chunkPath);
            lunar::ErrorLogger::instance().addContext("fuel used", std::to_string(executor->fuelUsed()));
            reportScriptError(result);
            return 1;
        }

        for (std::size_t i = 0; i < result.values.size(); ++i) {
            std::cout << (i == 0 ? "" : "\t") << lunar::toDisplayString(result.values[i]);
        }
        if (!result.values.empty()) {
            std::cout << "\n";
        }
    } catch (const lunar::FatalError& ex) {
        LUNAR_LOG_EXCEPTION(ex);
        return 3;
    }
    return 0;
}
