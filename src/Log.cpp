#include "Log.hpp"

#include <iostream>

namespace Log {
    namespace {
        Level threshold = Level::Info;

        const char* levelTag(Level level) {
            switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO ";
            case Level::Warn:  return "WARN ";
            case Level::Error: return "ERROR";
            default:           return "     ";
            }
        }
    }

    void setLevel(Level level) { threshold = level; }
    Level getLevel() { return threshold; }

    void write(Level level, const std::string &msg) {
        if (level == Level::Off || level < threshold) return;
        std::clog << "[blockroll] " << levelTag(level) << " " << msg << std::endl;
    }
}
