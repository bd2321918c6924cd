/* -- C++ -- */
/**
 *  @file  core/include/Log.hh
 *
 *  @brief `[prefix] LEVEL key=value ...` lines on stderr, and the routing of
 *         histogram warnings onto them.
 */

#ifndef HISTPOST_CORE_LOG_H
#define HISTPOST_CORE_LOG_H

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include <unistd.h>

#include "HistogramWarning.hh"

namespace histpost
{

namespace log
{

enum class Level
{
    kInfo,
    kSuccess,
    kWarn,
    kError
};

/// Colour only on a terminal; NO_COLOR or HISTPOST_NO_COLOUR switch it off.
inline bool colour_enabled()
{
    static const bool enabled = std::getenv("NO_COLOR") == nullptr &&
                                std::getenv("HISTPOST_NO_COLOUR") == nullptr &&
                                ::isatty(::fileno(stderr)) != 0;
    return enabled;
}

inline const char *level_tag(const Level level)
{
    switch (level)
    {
    case Level::kSuccess:
        return "DONE";
    case Level::kWarn:
        return "WARN";
    case Level::kError:
        return "ERROR";
    case Level::kInfo:
    default:
        return "INFO";
    }
}

inline const char *level_ansi(const Level level)
{
    switch (level)
    {
    case Level::kSuccess:
        return "\033[1;32m";
    case Level::kWarn:
        return "\033[1;33m";
    case Level::kError:
        return "\033[1;31m";
    case Level::kInfo:
    default:
        return "\033[1;36m";
    }
}

/** \brief One log line built field by field and written by emit(). */
class Line
{
  public:
    Line(std::string prefix, Level level)
        : m_prefix(std::move(prefix)), m_level(level)
    {
    }

    template <typename T>
    Line &kv(const std::string &key, const T &value)
    {
        std::ostringstream out;
        out << std::boolalpha << value;
        return append(key + "=" + quoted(out.str()));
    }

    /// Uncoloured rendering, as written when stderr is not a terminal.
    std::string str() const { return "[" + m_prefix + "] " + level_tag(m_level) + m_body; }

    void emit() const
    {
        if (!colour_enabled())
        {
            std::cerr << str() << "\n";
            return;
        }
        std::cerr << "\033[1;34m[" << m_prefix << "]\033[0m " << level_ansi(m_level) << level_tag(m_level)
                  << "\033[0m" << m_body << "\n";
    }

  private:
    // Values with blanks or quotes are quoted so that lines split cleanly on spaces.
    static std::string quoted(const std::string &value)
    {
        if (!value.empty() && value.find_first_of(" \t\"") == std::string::npos)
        {
            return value;
        }
        std::string out = "\"";
        for (char c : value)
        {
            if (c == '"' || c == '\\')
            {
                out += '\\';
            }
            out += c;
        }
        return out + "\"";
    }

    Line &append(const std::string &piece)
    {
        m_body += " " + piece;
        return *this;
    }

    std::string m_prefix;
    Level m_level;
    std::string m_body;
};

inline Line info(const std::string &prefix) { return Line(prefix, Level::kInfo); }
inline Line success(const std::string &prefix) { return Line(prefix, Level::kSuccess); }
inline Line error(const std::string &prefix) { return Line(prefix, Level::kError); }

inline Line warning_line(const std::string &prefix, const HistogramWarning &warning, const std::string &action)
{
    Line line(prefix, is_informational(warning.kind) ? Level::kInfo : Level::kWarn);
    line.kv("kind", warning_kind_name(warning.kind)).kv("histogram", warning.histogram_name);
    for (const auto &field : warning.context)
    {
        line.kv(field.first, field.second);
    }
    line.kv("action", action);
    return line;
}

/** \brief Emits a histogram warning at the level its kind calls for.
 *
 *  Real problems go out as WARN. Zero integrals are INFO; histograms already
 *  at target are INFO and only shown when `verbose`.
 */
inline void report(const std::string &prefix, const HistogramWarning &warning, const std::string &action, bool verbose)
{
    if (warning.kind == WarningKind::kAlreadyAtTarget && !verbose)
    {
        return;
    }
    warning_line(prefix, warning, action).emit();
}

} // namespace log

} // namespace histpost

#endif // HISTPOST_CORE_LOG_H
