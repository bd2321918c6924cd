/* -- C++ -- */
/**
 *  @file  core/include/ScalingConfig.hh
 *
 *  @brief Cross-section table and integrated luminosity shared by every
 *         component that computes a target yield.
 */

#ifndef HISTPOST_CORE_SCALING_CONFIG_H
#define HISTPOST_CORE_SCALING_CONFIG_H

#include <map>
#include <optional>
#include <string>

namespace histpost
{

/** \brief Immutable normalisation constants, passed by reference to each consumer. */
class ScalingConfig
{
  public:
    static constexpr double kDefaultLumi = 3378.0; // pb^-1

    ScalingConfig(std::map<std::string, double> xsec_pb, double lumi_inv_pb);

    /// CMS open data ttbar cross sections and luminosity.
    static ScalingConfig defaults();

    double lumi() const noexcept { return m_lumi; }
    const std::map<std::string, double> &xsec_table() const noexcept { return m_xsec; }

    bool knows(const std::string &process) const;
    std::optional<double> xsec(const std::string &process) const;

    /// xsec * lumi, or nullopt for an unknown process.
    std::optional<double> target_yield(const std::string &process) const;

  private:
    std::map<std::string, double> m_xsec;
    double m_lumi;
};

} // namespace histpost

#endif // HISTPOST_CORE_SCALING_CONFIG_H
