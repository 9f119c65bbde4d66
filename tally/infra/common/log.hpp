// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>

#include <tally/infra/common/terminal.hpp>

namespace tally::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether timestamps should include the timezone identifier
    bool log_timezone{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process or in tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

class BufferBase {
  public:
    explicit BufferBase(Level level);
    ~BufferBase() { flush(); }

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }

  protected:
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
};

}  // namespace tally::log

#define TALLY_LOGBUFFER(level_)                \
    if (!tally::log::test_verbosity(level_)) { \
    } else                                     \
        tally::log::LogBuffer<level_>()

#define TALLY_TRACE TALLY_LOGBUFFER(tally::log::Level::kTrace)
#define TALLY_DEBUG TALLY_LOGBUFFER(tally::log::Level::kDebug)
#define TALLY_INFO TALLY_LOGBUFFER(tally::log::Level::kInfo)
#define TALLY_WARN TALLY_LOGBUFFER(tally::log::Level::kWarning)
#define TALLY_ERROR TALLY_LOGBUFFER(tally::log::Level::kError)
#define TALLY_CRIT TALLY_LOGBUFFER(tally::log::Level::kCritical)
#define TALLY_LOG TALLY_LOGBUFFER(tally::log::Level::kNone)
