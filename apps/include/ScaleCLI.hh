/* -- C++ -- */
/**
 *  @file  apps/include/ScaleCLI.hh
 *
 *  @brief Argument parsing for histpostScale.
 */
#ifndef HISTPOST_APPS_SCALECLI_H
#define HISTPOST_APPS_SCALECLI_H

#include <string>
#include <vector>

#include "AppUtils.hh"
#include "HistogramScaler.hh"

namespace histpost
{

namespace app
{

namespace scale
{

inline const char *usage()
{
    return "Usage: histpostScale [--dry-run] [--no-overwrite] [--verbose|-v] [--inputs MANIFEST.json] FILE.root [FILE.root ...]";
}

struct Args
{
    std::vector<std::string> files;
    histpost::ScaleOptions options;
    std::string manifest_path;
    bool help = false;
};

inline Args parse_args(const std::vector<std::string> &args)
{
    Args out;
    out.manifest_path = env_value(kInputsVariable).value_or("");
    if (wants_help(args))
    {
        out.help = true;
        return out;
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--dry-run")
        {
            out.options.dry_run = true;
        }
        else if (arg == "--no-overwrite")
        {
            out.options.overwrite = false;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            out.options.verbose = true;
        }
        else if (arg == "--inputs")
        {
            out.manifest_path = take_value(args, i, arg, usage());
        }
        else if (is_option(arg))
        {
            throw UsageError("unknown option " + arg, usage());
        }
        else
        {
            out.files.push_back(path_arg(arg));
        }
    }

    if (out.files.empty())
    {
        throw UsageError("no input files given", usage());
    }
    return out;
}

}

}

}

#endif
