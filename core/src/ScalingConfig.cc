/* -- C++ -- */
/**
 *  @file  core/src/ScalingConfig.cc
 *
 *  @brief Implementation for the normalisation constants.
 */

#include "ScalingConfig.hh"

#include <stdexcept>
#include <utility>

namespace histpost
{

ScalingConfig::ScalingConfig(std::map<std::string, double> xsec_pb, double lumi_inv_pb)
    : m_xsec(std::move(xsec_pb)), m_lumi(lumi_inv_pb)
{
    if (!(m_lumi > 0.0))
    {
        throw std::invalid_argument("ScalingConfig: luminosity must be positive");
    }
    for (const auto &kv : m_xsec)
    {
        if (!(kv.second > 0.0))
        {
            throw std::invalid_argument("ScalingConfig: non-positive cross section for " + kv.first);
        }
    }
}

ScalingConfig ScalingConfig::defaults()
{
    std::map<std::string, double> xsec;
    xsec["ttbar"] = 396.87 + 332.97;
    xsec["single_top_s_chan"] = 2.0268 + 1.2676;
    xsec["single_top_t_chan"] = (36.993 + 22.175) / 0.252;
    xsec["single_top_tW"] = 37.936 + 37.906;
    xsec["wjets"] = 61457 * 0.252;
    xsec["zprimet"] = 700.0;
    return ScalingConfig(std::move(xsec), kDefaultLumi);
}

bool ScalingConfig::knows(const std::string &process) const
{
    return m_xsec.find(process) != m_xsec.end();
}

std::optional<double> ScalingConfig::xsec(const std::string &process) const
{
    const auto it = m_xsec.find(process);
    if (it == m_xsec.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> ScalingConfig::target_yield(const std::string &process) const
{
    const auto value = xsec(process);
    if (!value)
    {
        return std::nullopt;
    }
    return *value * m_lumi;
}

} // namespace histpost
