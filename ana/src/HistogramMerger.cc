/* -- C++ -- */
/**
 *  @file  ana/src/HistogramMerger.cc
 *
 *  @brief Implementation for the shard merge.
 */

#include "HistogramMerger.hh"

#include <set>
#include <utility>

#include "HistogramStore.hh"
#include "Log.hh"
#include "MetadataCodec.hh"
#include "NameCodec.hh"
#include "PseudodataSynthesizer.hh"

namespace histpost
{

HistogramMerger::HistogramMerger(const ScalingConfig &config, std::string log_prefix)
    : m_config(config), m_log_prefix(std::move(log_prefix))
{
}

MergedFile HistogramMerger::merge(const std::vector<std::string> &sources, const ProcessYieldMap &by_process) const
{
    std::vector<std::vector<HistogramRecord>> loaded;
    loaded.reserve(sources.size());
    for (const auto &source : sources)
    {
        HistogramStore store = HistogramStore::open_read(source);
        loaded.push_back(store.list());
        store.close();

        log::info(m_log_prefix)
            .kv("action", "merge_read")
            .kv("source", source)
            .kv("histograms", loaded.back().size())
            .emit();
    }

    MergedFile out;
    std::set<std::string> seen;
    for (size_t i = 0; i < loaded.size(); ++i)
    {
        for (auto &record : loaded[i])
        {
            const std::string stored_name = record.name;
            record.name = NameCodec::simplify(record.name);

            const auto id = NameCodec::parse_merged_name(record.name);
            if (!id)
            {
                HistogramWarning warning{WarningKind::kUnparseableName, stored_name, {{"source", sources[i]}}};
                log::report(m_log_prefix, warning, "dropped", true);
                out.warnings.push_back(std::move(warning));
                continue;
            }
            record.region = id->region;
            record.process = id->process;
            record.variation = id->variation;

            if (!seen.insert(record.name).second)
            {
                HistogramWarning warning{WarningKind::kDuplicateName, record.name, {{"source", sources[i]}}};
                log::report(m_log_prefix, warning, "kept", true);
                out.warnings.push_back(std::move(warning));
            }
            out.records.push_back(std::move(record));
        }
    }

    out.metadata = MetadataCodec::compose(out.records, m_config, by_process);
    return out;
}

std::vector<HistogramRecord> HistogramMerger::write(const MergedFile &merged, const std::string &output) const
{
    HistogramStore store = HistogramStore::open_write(output);
    for (const auto &record : merged.records)
    {
        store.write(record);
    }

    std::vector<HistogramRecord> pseudodata = PseudodataSynthesizer::synthesize(merged.records);
    for (const auto &record : pseudodata)
    {
        store.write(record);
    }

    if (merged.metadata)
    {
        store.write_metadata(*merged.metadata);
    }
    store.commit();

    log::success(m_log_prefix)
        .kv("action", "merge_write")
        .kv("status", "complete")
        .kv("output", output)
        .kv("histograms", merged.records.size())
        .kv("pseudodata", pseudodata.size())
        .emit();
    return pseudodata;
}

} // namespace histpost
