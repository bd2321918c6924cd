/* -- C++ -- */
/**
 *  @file  apps/include/AppUtils.hh
 *
 *  @brief Command-line plumbing shared by the histpost executables.
 *
 *  Options are scanned left to right over a plain vector of words. Usage
 *  problems raise UsageError, which run_guarded reports together with the
 *  usage line and turns into exit status 2; any other exception is a fatal
 *  error with exit status 1.
 */
#ifndef HISTPOST_APPS_APP_UTILS_H
#define HISTPOST_APPS_APP_UTILS_H

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Log.hh"

namespace histpost
{

namespace app
{

/// Environment variable naming the input manifest when --inputs is absent.
inline const char *const kInputsVariable = "HISTPOST_INPUTS";

class UsageError : public std::runtime_error
{
  public:
    UsageError(const std::string &what, std::string usage)
        : std::runtime_error(what), m_usage(std::move(usage))
    {
    }

    const std::string &usage() const noexcept { return m_usage; }

  private:
    std::string m_usage;
};

inline std::vector<std::string> args_of(int argc, char **argv)
{
    return argc > 1 ? std::vector<std::string>(argv + 1, argv + argc) : std::vector<std::string>();
}

/// Set and non-empty, or nullopt.
inline std::optional<std::string> env_value(const char *name)
{
    const char *value = std::getenv(name);
    if (!value || !*value)
    {
        return std::nullopt;
    }
    return std::string(value);
}

/// A path as typed, without surrounding blanks from quoted shell arguments.
inline std::string path_arg(const std::string &word)
{
    const auto first = word.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return std::string();
    }
    const auto last = word.find_last_not_of(" \t\r\n");
    return word.substr(first, last - first + 1);
}

inline bool wants_help(const std::vector<std::string> &args)
{
    for (const auto &arg : args)
    {
        if (arg == "-h" || arg == "--help")
        {
            return true;
        }
    }
    return false;
}

inline bool is_option(const std::string &arg)
{
    return arg.size() > 1 && arg[0] == '-';
}

/// Consumes the word after `args[i]` as the value of `flag`.
inline std::string take_value(const std::vector<std::string> &args, size_t &i, const std::string &flag,
                              const std::string &usage)
{
    if (i + 1 >= args.size() || is_option(args[i + 1]))
    {
        throw UsageError(flag + " requires a value", usage);
    }
    return path_arg(args[++i]);
}

inline int run_guarded(const std::string &log_prefix, const std::function<int()> &func)
{
    try
    {
        return func();
    }
    catch (const UsageError &e)
    {
        log::error(log_prefix).kv("usage_error", e.what()).emit();
        std::cerr << e.usage() << "\n";
        return 2;
    }
    catch (const std::exception &e)
    {
        log::error(log_prefix).kv("fatal_error", e.what()).emit();
        return 1;
    }
}

}

}

#endif
