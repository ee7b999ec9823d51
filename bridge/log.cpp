// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Leveled diagnostic logging

#include "log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace fheweb3 {
namespace log {

namespace {

Level initialLevel() {
    const char* env = std::getenv("FHEWEB3_LOG");
    Level parsed = Level::Warn;
    if (env && parseLevel(env, &parsed)) {
        return parsed;
    }
    return Level::Warn;
}

std::atomic<int>& levelStorage() {
    static std::atomic<int> storage{static_cast<int>(initialLevel())};
    return storage;
}

std::mutex& sinkMutex() {
    static std::mutex mtx;
    return mtx;
}

const char* levelName(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        case Level::Off:   return "OFF";
    }
    return "?";
}

} // anonymous namespace

void setLevel(Level level) {
    levelStorage().store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(levelStorage().load(std::memory_order_relaxed));
}

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<int>(lvl) <= static_cast<int>(level());
}

bool parseLevel(const std::string& text, Level* out) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "off")   { *out = Level::Off;   return true; }
    if (lower == "error") { *out = Level::Error; return true; }
    if (lower == "warn")  { *out = Level::Warn;  return true; }
    if (lower == "info")  { *out = Level::Info;  return true; }
    if (lower == "debug") { *out = Level::Debug; return true; }
    return false;
}

void write(Level lvl, const char* component, const std::string& message) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    std::cerr << "[FHEWEB3] [" << component << "] " << levelName(lvl) << ' '
              << message << std::endl;
}

} // namespace log
} // namespace fheweb3
