/* -- C++ -- */
/**
 *  @file  ana/src/ScaleFactorResolver.cc
 *
 *  @brief Implementation for the per-histogram scale factor resolution.
 */

#include "ScaleFactorResolver.hh"

#include <cmath>
#include <sstream>
#include <utility>

#include "NameCodec.hh"

namespace histpost
{

const char *ScaleDecision::reason() const
{
    if (warning)
    {
        return warning_kind_name(warning->kind);
    }
    return "";
}

ScaleFactorResolver::ScaleFactorResolver(const ScalingConfig &config)
    : m_config(config)
{
}

namespace
{

std::string format_number(double value)
{
    std::ostringstream out;
    out << value;
    return out.str();
}

}

ScaleDecision ScaleFactorResolver::copy_unscaled(ScaleDecision decision,
                                                 WarningKind kind,
                                                 const std::string &histogram_name)
{
    HistogramWarning warning{kind, histogram_name, {}};
    if (!decision.process.empty())
    {
        warning.context.emplace_back("process", decision.process);
    }
    if (kind == WarningKind::kZeroIntegral || kind == WarningKind::kAlreadyAtTarget)
    {
        warning.context.emplace_back("current", format_number(decision.current));
        warning.context.emplace_back("target", format_number(decision.target));
    }

    decision.action = ScaleDecision::Action::kCopyUnscaled;
    decision.factor = 1.0;
    decision.source = FactorSource::kNone;
    decision.warning = std::move(warning);
    return decision;
}

ScaleDecision ScaleFactorResolver::resolve(const HistogramRecord &record,
                                           const std::optional<ScalingMetadata> &metadata) const
{
    ScaleDecision decision;
    decision.current = record.integral();

    const auto id = NameCodec::parse_scaled_name(record.name);
    if (!id)
    {
        return copy_unscaled(std::move(decision), WarningKind::kUnparseableName, record.name);
    }
    decision.process = id->process;

    const auto target = m_config.target_yield(id->process);
    if (!target)
    {
        return copy_unscaled(std::move(decision), WarningKind::kUnknownProcess, record.name);
    }
    decision.target = *target;

    if (metadata)
    {
        if (const auto nevents = metadata->nevents(id->process))
        {
            decision.action = ScaleDecision::Action::kScale;
            decision.factor = *target / *nevents;
            decision.source = FactorSource::kMetadata;
            return decision;
        }
    }

    if (!(decision.current > 0.0))
    {
        return copy_unscaled(std::move(decision), WarningKind::kZeroIntegral, record.name);
    }

    const double rel_diff = std::fabs(decision.current - decision.target) / decision.target;
    if (rel_diff < kTargetTolerance)
    {
        return copy_unscaled(std::move(decision), WarningKind::kAlreadyAtTarget, record.name);
    }

    decision.action = ScaleDecision::Action::kScale;
    decision.factor = decision.target / decision.current;
    decision.source = FactorSource::kIntegralRatio;
    return decision;
}

HistogramRecord ScaleFactorResolver::apply(const HistogramRecord &record, const ScaleDecision &decision)
{
    if (!decision.scales())
    {
        return record;
    }
    return record.scaled(decision.factor);
}

} // namespace histpost
