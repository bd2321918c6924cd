/* -- C++ -- */
/**
 *  @file  ana/src/ResultFlattener.cc
 *
 *  @brief Implementation for the analysis result flattening.
 */

#include "ResultFlattener.hh"

#include <type_traits>
#include <utility>

#include "NameCodec.hh"

namespace histpost
{

std::string ResultFlattener::variation_from_key(const std::string &key)
{
    const auto pos = key.find_last_of(':');
    return (pos == std::string::npos) ? key : key.substr(pos + 1);
}

std::string ResultFlattener::replace_all(std::string text, const std::string &from, const std::string &to)
{
    if (from.empty())
    {
        return text;
    }
    size_t pos = text.find(from);
    while (pos != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos = text.find(from, pos + to.size());
    }
    return text;
}

std::vector<HistogramRecord> ResultFlattener::flatten(const std::vector<AnalysisResult> &results)
{
    std::vector<HistogramRecord> out;
    for (const auto &result : results)
    {
        std::visit(
            [&](const auto &histo)
            {
                using T = std::decay_t<decltype(histo)>;
                if constexpr (std::is_same_v<T, SingleHistogram>)
                {
                    HistogramRecord record = histo.histogram;
                    record.region = result.region;
                    record.process = result.process;
                    record.variation = result.variation;
                    out.push_back(std::move(record));
                }
                else
                {
                    for (const auto &entry : histo.histograms)
                    {
                        const std::string variation = variation_from_key(entry.first);
                        HistogramRecord record = entry.second;
                        record.name = replace_all(record.name, NameCodec::kNominal, variation);
                        record.region = result.region;
                        record.process = result.process;
                        record.variation = variation;
                        out.push_back(std::move(record));
                    }
                }
            },
            result.histo);
    }
    return out;
}

} // namespace histpost
