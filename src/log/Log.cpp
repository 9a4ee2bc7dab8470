#include "lamina/log/Log.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace lamina::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();

LogHandler currentHandler(const LogHandler& handler) {
    std::lock_guard lock(sinkMutex);
    return handler;
}

void installHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

} // namespace

void logInfo(std::string_view message) {
    if (auto handler = currentHandler(infoHandler)) {
        handler(message);
    }
}

void logError(std::string_view message) {
    if (auto handler = currentHandler(errorHandler)) {
        handler(message);
    }
}

ScopedLogHandlers::ScopedLogHandlers(LogHandler newInfo, LogHandler newError)
: previousInfo_(currentHandler(infoHandler))
, previousError_(currentHandler(errorHandler)) {
    installHandlers(std::move(newInfo), std::move(newError));
}

ScopedLogHandlers::~ScopedLogHandlers() {
    installHandlers(std::move(previousInfo_), std::move(previousError_));
}

} // namespace lamina::log
