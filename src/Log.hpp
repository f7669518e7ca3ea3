#ifndef BLOCKROLL_LOG_HPP
#define BLOCKROLL_LOG_HPP

#include <string>

// ============================================================================
// LOG MODULE
// ============================================================================

namespace Log {
    enum class Level {
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    void setLevel(Level level);
    Level getLevel();

    void write(Level level, const std::string &msg);

    inline void debug(const std::string &msg) { write(Level::Debug, msg); }
    inline void info(const std::string &msg) { write(Level::Info, msg); }
    inline void warn(const std::string &msg) { write(Level::Warn, msg); }
    inline void error(const std::string &msg) { write(Level::Error, msg); }
}

#endif
