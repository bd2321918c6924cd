/* -- C++ -- */
/**
 *  @file  apps/src/histpostSplitInputs.cc
 *
 *  @brief Splits the input manifest into one file per process.
 */

#include <iostream>
#include <string>
#include <vector>

#include "AppUtils.hh"
#include "InputManifest.hh"

namespace
{

const char *kUsage = "Usage: histpostSplitInputs [MANIFEST.json] [OUTDIR]";

}

int main(int argc, char **argv)
{
    return histpost::app::run_guarded(
        "histpostSplitInputs",
        [argc, argv]()
        {
            const std::vector<std::string> args = histpost::app::args_of(argc, argv);
            if (histpost::app::wants_help(args))
            {
                std::cout << kUsage << "\n";
                return 0;
            }
            if (args.size() > 2)
            {
                throw histpost::app::UsageError("too many arguments", kUsage);
            }

            std::string manifest_path = histpost::app::env_value(histpost::app::kInputsVariable)
                                            .value_or(histpost::InputManifest::kDefaultPath);
            if (!args.empty())
            {
                manifest_path = histpost::app::path_arg(args[0]);
            }
            const std::string out_dir = args.size() == 2 ? histpost::app::path_arg(args[1]) : "inputs";

            const histpost::InputManifest manifest = histpost::InputManifest::read(manifest_path);
            const auto written = manifest.write_split(out_dir);

            histpost::log::success("histpostSplitInputs")
                .kv("action", "split")
                .kv("status", "complete")
                .kv("manifest", manifest_path)
                .kv("files", written.size())
                .kv("output_dir", out_dir)
                .emit();
            return 0;
        });
}
