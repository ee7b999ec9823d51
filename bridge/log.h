// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Leveled diagnostic logging
//
// Lines go to stderr as "[FHEWEB3] [component] LEVEL message". The initial
// level comes from the FHEWEB3_LOG environment variable (error, warn, info,
// debug, off) and defaults to warn.

#ifndef FHEWEB3_LOG_H
#define FHEWEB3_LOG_H

#include <sstream>
#include <string>

namespace fheweb3 {
namespace log {

enum class Level : int {
    Off = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

void setLevel(Level level);
Level level();

bool enabled(Level level);

// Parse "error", "warn", "info", "debug", "off" (case-insensitive)
bool parseLevel(const std::string& text, Level* out);

void write(Level level, const char* component, const std::string& message);

// Stream-style helper: Line(Level::Info, "registry") << "built " << n;
class Line {
public:
    Line(Level level, const char* component) : level_(level), component_(component) {}
    ~Line() {
        if (enabled(level_)) {
            write(level_, component_, stream_.str());
        }
    }

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <typename T>
    Line& operator<<(const T& value) {
        if (enabled(level_)) {
            stream_ << value;
        }
        return *this;
    }

private:
    Level level_;
    const char* component_;
    std::ostringstream stream_;
};

} // namespace log
} // namespace fheweb3

#endif // FHEWEB3_LOG_H
