/* -- C++ -- */
/**
 *  @file  ana/include/HistogramScaler.hh
 *
 *  @brief Normalisation pass over one merged histogram file.
 */

#ifndef HISTPOST_ANA_HISTOGRAM_SCALER_H
#define HISTPOST_ANA_HISTOGRAM_SCALER_H

#include <optional>
#include <string>
#include <vector>

#include "HistogramWarning.hh"
#include "ScaleFactorResolver.hh"
#include "ScalingConfig.hh"
#include "ScalingMetadata.hh"

namespace histpost
{

class HistogramStore;

struct ScaleOptions
{
    bool overwrite = true;
    bool dry_run = false;
    bool verbose = false;
};

struct ScaleSummary
{
    std::string input_path;
    std::string output_path;
    bool metadata_found = false;
    int n_scaled = 0;
    int n_skipped = 0;
    std::vector<HistogramWarning> warnings;
};

class HistogramScaler
{
  public:
    HistogramScaler(const ScalingConfig &config,
                    ScaleOptions options,
                    std::string log_prefix = "histpost scale");

    /// Yields used when a file carries no usable metadata (e.g. from the input manifest).
    void set_fallback_yields(ProcessYieldMap yields);

    /// Throws StoreError when the input cannot be opened or the output cannot be written.
    ScaleSummary scale_file(const std::string &path) const;

  private:
    std::optional<ScalingMetadata> load_metadata(const HistogramStore &store, ScaleSummary &summary) const;

    const ScalingConfig &m_config;
    ScaleOptions m_options;
    std::string m_log_prefix;
    std::optional<ProcessYieldMap> m_fallback_yields;
};

} // namespace histpost

#endif // HISTPOST_ANA_HISTOGRAM_SCALER_H
