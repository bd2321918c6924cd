/* -- C++ -- */
/**
 *  @file  ana/include/HistogramMerger.hh
 *
 *  @brief Consolidation of per-shard histogram files into one merged file.
 */

#ifndef HISTPOST_ANA_HISTOGRAM_MERGER_H
#define HISTPOST_ANA_HISTOGRAM_MERGER_H

#include <optional>
#include <string>
#include <vector>

#include "HistogramRecord.hh"
#include "HistogramWarning.hh"
#include "ScalingConfig.hh"
#include "ScalingMetadata.hh"

namespace histpost
{

struct MergedFile
{
    std::vector<HistogramRecord> records;
    std::optional<ScalingMetadata> metadata;
    std::vector<HistogramWarning> warnings;
};

/** \brief Shard merge, not statistics accumulation.
 *
 *  Records are concatenated in first-seen order. Two shards providing the
 *  same name keep both records; the collision is reported, never summed.
 */
class HistogramMerger
{
  public:
    explicit HistogramMerger(const ScalingConfig &config, std::string log_prefix = "histpost merge");

    /// Throws StoreError if any source is unreadable, before anything is merged.
    MergedFile merge(const std::vector<std::string> &sources, const ProcessYieldMap &by_process = {}) const;

    /// Writes records, pseudodata and metadata; returns the pseudodata records added.
    std::vector<HistogramRecord> write(const MergedFile &merged, const std::string &output) const;

  private:
    const ScalingConfig &m_config;
    std::string m_log_prefix;
};

} // namespace histpost

#endif // HISTPOST_ANA_HISTOGRAM_MERGER_H
