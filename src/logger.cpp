/*─────────────────────────────────────────────────────────────
  File: src/logger.cpp

  Console + file logger and stage timer.

  Line layout:
    console : "<TAG>  <message>"            (TAG colored on a terminal)
    file    : "[  <elapsed> s] <TAG>  <message>"

  The elapsed stamp counts from Logger construction, so the file alone
  shows where a long run spent its time. Console colors are decided
  once per line with isatty(fileno(stdout)); the file never gets escape
  codes.
─────────────────────────────────────────────────────────────*/
#include "logger.hpp"

#include <cstdio>            // fileno, std::snprintf
#include <iomanip>
#include <sstream>
#include <unistd.h>          // isatty

namespace itide {

namespace {

struct TagStyle {
    const char* plain;
    const char* colored;
};

// indexed by Logger::Level
constexpr TagStyle kTags[] = {
    {"INFO",  "\033[102mINFO\033[0m"},
    {"WARN",  "\033[103mWARN\033[0m"},
    {"ERROR", "\033[101mERROR\033[0m"},
};

const TagStyle& style(Logger::Level l)
{
    return kTags[static_cast<int>(l)];
}

} // anonymous namespace

const char* Logger::level_tag(Level l)
{
    return isatty(fileno(stdout)) ? style(l).colored : style(l).plain;
}

Logger::Logger(const std::string& p, bool console)
    : start_(std::chrono::steady_clock::now()), console_(console)
{
    file_.open(p, std::ios::trunc);
}

Logger::~Logger() { if (file_.is_open()) file_.close(); }

/*=====================================================================
  Logger::write

  ERR lines reach stdout even when the console is muted.
=====================================================================*/
void Logger::write(Level lvl, const std::string& msg)
{
    std::lock_guard<std::mutex> g(mtx_);
    if (console_ || lvl == Level::ERR)
        std::cout << level_tag(lvl) << "  " << msg << '\n' << std::flush;

    if (file_) {
        std::chrono::duration<double> t = std::chrono::steady_clock::now() - start_;
        char stamp[32];
        std::snprintf(stamp, sizeof stamp, "[%9.3f s] ", t.count());
        file_ << stamp << style(lvl).plain << "  " << msg << '\n';
    }
}

/*=====================================================================
  StageTimer
=====================================================================*/
StageTimer::StageTimer(Logger& log, const std::string& name)
    : log_(log), start_(std::chrono::steady_clock::now())
{
    log_.stage(name);
}

StageTimer::~StageTimer()
{
    if (!done_) finish();
}

double StageTimer::seconds() const
{
    std::chrono::duration<double> dt = std::chrono::steady_clock::now() - start_;
    return dt.count();
}

void StageTimer::finish()
{
    done_ = true;
    std::ostringstream oss;
    oss << "   time: " << std::fixed << std::setprecision(6) << seconds() << " s";
    log_.info(oss.str());
}

} // namespace itide
