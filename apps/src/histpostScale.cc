/* -- C++ -- */
/**
 *  @file  apps/src/histpostScale.cc
 *
 *  @brief Main entrypoint for normalising merged histogram files to
 *         cross section times luminosity.
 */

#include "ScaleCLI.hh"

#include <iostream>
#include <string>
#include <vector>

#include "HistogramScaler.hh"
#include "InputManifest.hh"
#include "ScalingConfig.hh"

namespace histpost
{

namespace app
{

int run(const scale::Args &scale_args, const std::string &log_prefix)
{
    const histpost::ScalingConfig config = histpost::ScalingConfig::defaults();
    histpost::HistogramScaler scaler(config, scale_args.options, log_prefix);

    if (!scale_args.manifest_path.empty())
    {
        const histpost::InputManifest manifest = histpost::InputManifest::read(scale_args.manifest_path);
        scaler.set_fallback_yields(manifest.by_process(config));
        log::info(log_prefix).kv("action", "manifest_load").kv("manifest", scale_args.manifest_path).emit();
    }

    int total_scaled = 0;
    int total_skipped = 0;
    for (const auto &file : scale_args.files)
    {
        const histpost::ScaleSummary summary = scaler.scale_file(file);
        total_scaled += summary.n_scaled;
        total_skipped += summary.n_skipped;
    }

    log::success(log_prefix)
        .kv("action", "batch")
        .kv("status", "complete")
        .kv("files", scale_args.files.size())
        .kv("scaled", total_scaled)
        .kv("skipped", total_skipped)
        .kv("dry_run", scale_args.options.dry_run)
        .emit();
    return 0;
}

}

}

int main(int argc, char **argv)
{
    return histpost::app::run_guarded(
        "histpostScale",
        [argc, argv]()
        {
            const std::vector<std::string> args = histpost::app::args_of(argc, argv);
            const histpost::app::scale::Args scale_args = histpost::app::scale::parse_args(args);
            if (scale_args.help)
            {
                std::cout << histpost::app::scale::usage() << "\n";
                return 0;
            }
            return histpost::app::run(scale_args, "histpostScale");
        });
}
