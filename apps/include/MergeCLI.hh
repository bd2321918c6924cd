/* -- C++ -- */
/**
 *  @file  apps/include/MergeCLI.hh
 *
 *  @brief Argument parsing for histpostMerge.
 */
#ifndef HISTPOST_APPS_MERGECLI_H
#define HISTPOST_APPS_MERGECLI_H

#include <string>
#include <vector>

#include "AppUtils.hh"

namespace histpost
{

namespace app
{

namespace merge
{

inline const char *usage()
{
    return "Usage: histpostMerge [--inputs MANIFEST.json] OUTPUT.root PARTIAL.root [PARTIAL.root ...]";
}

struct Args
{
    std::string output_path;
    std::vector<std::string> sources;
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

    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--inputs")
        {
            out.manifest_path = take_value(args, i, arg, usage());
        }
        else if (is_option(arg))
        {
            throw UsageError("unknown option " + arg, usage());
        }
        else
        {
            positional.push_back(path_arg(arg));
        }
    }

    if (positional.size() < 2)
    {
        throw UsageError("an output and at least one partial file are required", usage());
    }
    out.output_path = positional.front();
    out.sources.assign(positional.begin() + 1, positional.end());

    for (const auto &source : out.sources)
    {
        if (source == out.output_path)
        {
            throw UsageError("merge output must differ from every input: " + source, usage());
        }
    }
    return out;
}

}

}

}

#endif
