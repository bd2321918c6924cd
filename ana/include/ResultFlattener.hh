/* -- C++ -- */
/**
 *  @file  ana/include/ResultFlattener.hh
 *
 *  @brief Turns booked analysis results into flat, individually named
 *         histogram records.
 */

#ifndef HISTPOST_ANA_RESULT_FLATTENER_H
#define HISTPOST_ANA_RESULT_FLATTENER_H

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "HistogramRecord.hh"

namespace histpost
{

struct SingleHistogram
{
    HistogramRecord histogram;
};

/** \brief Systematic variations of one booking, keyed `<column>:<variation>`. */
struct VariationMap
{
    std::vector<std::pair<std::string, HistogramRecord>> histograms;
};

using ResultHistogram = std::variant<SingleHistogram, VariationMap>;

struct AnalysisResult
{
    ResultHistogram histo;
    std::string region;
    std::string process;
    std::string variation;
};

/** \brief Ingestion entry point for analysis jobs handing over booked results.
 *
 *  The event loop that books the histograms lives outside this project; a job
 *  links histpost_ana, wraps each booking as an AnalysisResult and passes the
 *  flattened records to HistogramStore::write, or to the merger, unchanged.
 */
class ResultFlattener
{
  public:
    static std::vector<HistogramRecord> flatten(const std::vector<AnalysisResult> &results);

    /// Text after the last ':' of a variation key.
    static std::string variation_from_key(const std::string &key);

  private:
    static std::string replace_all(std::string text, const std::string &from, const std::string &to);
};

} // namespace histpost

#endif // HISTPOST_ANA_RESULT_FLATTENER_H
