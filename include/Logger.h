/**
 * @file Logger.h
 * @brief Minimal thread-safe file logger writing to ./<command>.log (or $MATTERWAVE_LOG).
 */
#pragma once

#include <exception>
#include <string>

class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    // Initialize using argv[0] to derive <command>.log path; MATTERWAVE_LOG overrides the path.
    static void initFromArgv0(const char* argv0);
    // Initialize explicitly with a filename (relative or absolute).
    static void init(const std::string& filename);
    // Flush and close the log file; safe to call multiple times.
    static void shutdown();
    // Whether a log file is open. Before init() every call is a silent no-op.
    static bool initialized();

    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void debug(const std::string& msg);

    // Convenience helpers for exception logging
    static void logException(const std::string& where, const std::exception& e);
    static void logUnknownException(const std::string& where);

    // Control log level (default: Info). Honors MATTERWAVE_LOG_LEVEL, then LOG_LEVEL
    // (debug, info, warn, error, none).
    static void setLevel(Level lvl);
    static Level level();
    // True if a message at @p lvl would be written; lets callers skip building expensive strings.
    static bool enabled(Level lvl);

private:
    static void logImpl(Level lvl, const std::string& msg);
};
