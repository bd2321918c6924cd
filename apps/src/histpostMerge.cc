/* -- C++ -- */
/**
 *  @file  apps/src/histpostMerge.cc
 *
 *  @brief Main entrypoint for merging partial histogram outputs.
 */

#include "MergeCLI.hh"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "HistogramMerger.hh"
#include "InputManifest.hh"
#include "ScalingConfig.hh"

namespace histpost
{

namespace app
{

int run(const merge::Args &merge_args, const std::string &log_prefix)
{
    const histpost::ScalingConfig config = histpost::ScalingConfig::defaults();

    histpost::ProcessYieldMap by_process;
    if (!merge_args.manifest_path.empty())
    {
        by_process = histpost::InputManifest::read(merge_args.manifest_path).by_process(config);
        log::info(log_prefix)
            .kv("action", "manifest_load")
            .kv("manifest", merge_args.manifest_path)
            .kv("processes", by_process.size())
            .emit();
    }

    std::filesystem::path output_path(merge_args.output_path);
    if (!output_path.parent_path().empty())
    {
        std::filesystem::create_directories(output_path.parent_path());
    }

    const histpost::HistogramMerger merger(config, log_prefix);
    const histpost::MergedFile merged = merger.merge(merge_args.sources, by_process);
    merger.write(merged, merge_args.output_path);
    return 0;
}

}

}

int main(int argc, char **argv)
{
    return histpost::app::run_guarded(
        "histpostMerge",
        [argc, argv]()
        {
            const std::vector<std::string> args = histpost::app::args_of(argc, argv);
            const histpost::app::merge::Args merge_args = histpost::app::merge::parse_args(args);
            if (merge_args.help)
            {
                std::cout << histpost::app::merge::usage() << "\n";
                return 0;
            }
            return histpost::app::run(merge_args, "histpostMerge");
        });
}
