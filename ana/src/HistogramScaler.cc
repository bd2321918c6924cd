/* -- C++ -- */
/**
 *  @file  ana/src/HistogramScaler.cc
 *
 *  @brief Implementation for the per-file normalisation pass.
 */

#include "HistogramScaler.hh"

#include <utility>

#include "HistogramStore.hh"
#include "Log.hh"
#include "MetadataCodec.hh"

namespace histpost
{

HistogramScaler::HistogramScaler(const ScalingConfig &config, ScaleOptions options, std::string log_prefix)
    : m_config(config), m_options(options), m_log_prefix(std::move(log_prefix))
{
}

void HistogramScaler::set_fallback_yields(ProcessYieldMap yields)
{
    m_fallback_yields = std::move(yields);
}

std::optional<ScalingMetadata> HistogramScaler::load_metadata(const HistogramStore &store,
                                                              ScaleSummary &summary) const
{
    std::optional<ScalingMetadata> metadata;
    try
    {
        metadata = store.read_metadata();
    }
    catch (const MetadataParseError &e)
    {
        HistogramWarning warning{WarningKind::kMetadataDecodeFailure,
                                 MetadataCodec::kMetadataKey,
                                 {{"file", store.path()}, {"detail", e.what()}}};
        log::warning_line(m_log_prefix, warning, "ignored").emit();
        summary.warnings.push_back(std::move(warning));
    }

    summary.metadata_found = metadata.has_value();
    if (!metadata && m_fallback_yields)
    {
        ScalingMetadata fallback;
        fallback.by_process = *m_fallback_yields;
        fallback.lumi = m_config.lumi();
        metadata = std::move(fallback);
    }

    if (m_options.verbose)
    {
        log::info(m_log_prefix)
            .kv("metadata_found", summary.metadata_found)
            .kv("fallback", (!summary.metadata_found && metadata) ? "manifest" : "none")
            .emit();
    }
    return metadata;
}

ScaleSummary HistogramScaler::scale_file(const std::string &path) const
{
    if (m_options.verbose)
    {
        log::info(m_log_prefix).kv("action", "open").kv("file", path).emit();
    }

    ScaleSummary summary;
    summary.input_path = path;

    HistogramStore input = HistogramStore::open_read(path);
    const std::optional<ScalingMetadata> metadata = load_metadata(input, summary);

    std::optional<HistogramStore> output;
    if (!m_options.dry_run)
    {
        summary.output_path = m_options.overwrite ? path : HistogramStore::scaled_sibling(path);
        output.emplace(HistogramStore::open_write(summary.output_path));
    }

    const ScaleFactorResolver resolver(m_config);
    for (const auto &record : input.list())
    {
        const ScaleDecision decision = resolver.resolve(record, metadata);

        if (!decision.scales())
        {
            log::report(m_log_prefix, *decision.warning, "copied_unscaled", m_options.verbose);
            summary.warnings.push_back(*decision.warning);
            if (output)
            {
                output->write(record);
            }
            ++summary.n_skipped;
            continue;
        }

        const char *source = decision.source == FactorSource::kMetadata ? "metadata" : "integral_ratio";
        if (!m_options.dry_run)
        {
            output->write(ScaleFactorResolver::apply(record, decision));
        }
        if (m_options.dry_run || m_options.verbose)
        {
            log::info(m_log_prefix)
                .kv("action", m_options.dry_run ? "dry_run" : "scaled")
                .kv("histogram", record.name)
                .kv("source", source)
                .kv("current", decision.current)
                .kv("target", decision.target)
                .kv("factor", decision.factor)
                .emit();
        }
        ++summary.n_scaled;
    }

    if (!output)
    {
        input.close();
        log::success(m_log_prefix)
            .kv("action", "dry_run")
            .kv("status", "complete")
            .kv("file", path)
            .kv("scaled", summary.n_scaled)
            .kv("skipped", summary.n_skipped)
            .emit();
        return summary;
    }

    output->copy_passthrough(input);
    input.close();
    output->commit();

    log::success(m_log_prefix)
        .kv("action", "scale")
        .kv("status", "complete")
        .kv("file", path)
        .kv("scaled", summary.n_scaled)
        .kv("skipped", summary.n_skipped)
        .kv("output", summary.output_path)
        .kv("overwritten", m_options.overwrite)
        .emit();
    return summary;
}

} // namespace histpost
