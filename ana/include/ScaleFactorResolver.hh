/* -- C++ -- */
/**
 *  @file  ana/include/ScaleFactorResolver.hh
 *
 *  @brief Chooses the factor that brings a histogram to its expected yield.
 */

#ifndef HISTPOST_ANA_SCALE_FACTOR_RESOLVER_H
#define HISTPOST_ANA_SCALE_FACTOR_RESOLVER_H

#include <optional>
#include <string>

#include "HistogramRecord.hh"
#include "HistogramWarning.hh"
#include "ScalingConfig.hh"
#include "ScalingMetadata.hh"

namespace histpost
{

enum class FactorSource
{
    kNone,
    kMetadata,
    kIntegralRatio
};

struct ScaleDecision
{
    enum class Action
    {
        kScale,
        kCopyUnscaled
    };

    Action action = Action::kCopyUnscaled;
    double factor = 1.0;
    FactorSource source = FactorSource::kNone;

    std::string process;
    double current = 0.0;
    double target = 0.0;

    /// Set for every kCopyUnscaled decision.
    std::optional<HistogramWarning> warning;

    bool scales() const { return action == Action::kScale; }
    const char *reason() const;
};

/** \brief Resolution order per histogram, first match wins:
 *
 *  1. name not parseable, or process not in the cross-section table: copy;
 *  2. metadata holds a positive event count: xsec * lumi / nevents;
 *  3. non-positive integral: copy;
 *  4. integral within 2% of xsec * lumi: copy, otherwise xsec * lumi / integral.
 *
 *  Never throws; callers decide what a warning means for them.
 */
class ScaleFactorResolver
{
  public:
    static constexpr double kTargetTolerance = 0.02;

    explicit ScaleFactorResolver(const ScalingConfig &config);

    ScaleDecision resolve(const HistogramRecord &record,
                          const std::optional<ScalingMetadata> &metadata) const;

    /// Scaled copy for kScale decisions, plain copy otherwise.
    static HistogramRecord apply(const HistogramRecord &record, const ScaleDecision &decision);

  private:
    static ScaleDecision copy_unscaled(ScaleDecision decision, WarningKind kind, const std::string &histogram_name);

    const ScalingConfig &m_config;
};

} // namespace histpost

#endif // HISTPOST_ANA_SCALE_FACTOR_RESOLVER_H
