/* -- C++ -- */
/**
 *  @file  core/include/ScalingMetadata.hh
 *
 *  @brief Per-file record of event counts and integrals stored beside merged
 *         histograms.
 */

#ifndef HISTPOST_CORE_SCALING_METADATA_H
#define HISTPOST_CORE_SCALING_METADATA_H

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace histpost
{

struct ProcessYield
{
    std::string variation = "nominal";
    double nevents = 0.0;
    double xsec = 0.0;
};

inline bool operator==(const ProcessYield &a, const ProcessYield &b)
{
    return a.variation == b.variation && a.nevents == b.nevents && a.xsec == b.xsec;
}

using ProcessYieldMap = std::map<std::string, ProcessYield>;

struct ScalingMetadata
{
    ProcessYieldMap by_process;
    std::vector<std::string> histogram_names;
    std::map<std::string, std::optional<double>> integrals;
    double lumi = 0.0;

    /// Event count recorded for `process`, when positive.
    std::optional<double> nevents(const std::string &process) const
    {
        const auto it = by_process.find(process);
        if (it == by_process.end() || !(it->second.nevents > 0.0))
        {
            return std::nullopt;
        }
        return it->second.nevents;
    }
};

inline bool operator==(const ScalingMetadata &a, const ScalingMetadata &b)
{
    return a.by_process == b.by_process && a.histogram_names == b.histogram_names &&
           a.integrals == b.integrals && a.lumi == b.lumi;
}

inline bool operator!=(const ScalingMetadata &a, const ScalingMetadata &b)
{
    return !(a == b);
}

} // namespace histpost

#endif // HISTPOST_CORE_SCALING_METADATA_H
