/*─────────────────────────────────────────────────────────────
  File: include/logger.hpp

  Logger: thread-safe run log, plus StageTimer for per-stage
  wall-clock reporting.

  Used in:
    - itide_main.cpp (options, fatal error reporting)
    - pipeline.cpp (stage banners, sizes, offsets, timings)
    - initial_state.cpp (worker count reporting)
    - state_writer.cpp (output summary)

  Each call produces one console line (unless muted) and one log-file
  line stamped with the seconds elapsed since the Logger was created.
  A mutex keeps lines from different worker threads whole.
─────────────────────────────────────────────────────────────*/
#pragma once

#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace itide {

class Logger
{
public:
    // ERR is also used for the fatal message printed by main()
    enum class Level { INFO, WARN, ERR };

    /*------------------------------------------------------------------
      Logger(logfile_path, console)

        logfile_path : truncated on open; if it cannot be opened the
                       logger keeps working console-only (file_open()
                       reports which)
        console      : false mutes INFO/WARN on stdout; ERR always
                       reaches stdout
    ------------------------------------------------------------------*/
    explicit Logger(const std::string& logfile_path, bool console = true);
    ~Logger();

    void write(Level level, const std::string& msg);

    void info (const std::string& m) { write(Level::INFO , m); }
    void warn (const std::string& m) { write(Level::WARN , m); }
    void error(const std::string& m) { write(Level::ERR  , m); }

    // "***   <name>" banner opening a pipeline stage
    void stage(const std::string& name) { write(Level::INFO, "***   " + name); }

    bool file_open() const { return file_.is_open(); }

    // console tag; ANSI-colored only when stdout is a terminal
    static const char* level_tag(Level);

private:
    std::ofstream file_;
    std::mutex    mtx_;
    std::chrono::steady_clock::time_point start_;
    bool          console_;
};

/*------------------------------------------------------------------
  StageTimer

  Announces a stage on construction and logs "   time: <s> s" when
  finish() is called (or on destruction if finish() was never called).
  seconds() can be queried at any point.
------------------------------------------------------------------*/
class StageTimer
{
public:
    StageTimer(Logger& log, const std::string& name);
    ~StageTimer();

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

    double seconds() const;
    void   finish();

private:
    Logger& log_;
    std::chrono::steady_clock::time_point start_;
    bool done_ = false;
};

} // namespace itide
