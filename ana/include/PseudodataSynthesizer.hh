/* -- C++ -- */
/**
 *  @file  ana/include/PseudodataSynthesizer.hh
 *
 *  @brief Stand-in data histograms built from simulated templates.
 */

#ifndef HISTPOST_ANA_PSEUDODATA_SYNTHESIZER_H
#define HISTPOST_ANA_PSEUDODATA_SYNTHESIZER_H

#include <string>
#include <vector>

#include "HistogramRecord.hh"

namespace histpost
{

/** \brief `<region>_pseudodata = wjets + 0.5 * ttbar_ME_var + 0.5 * ttbar_PS_var`.
 *
 *  The sum starts from a clone of the wjets histogram, so class, axis titles
 *  and labels follow it. Each region is synthesised independently: a region
 *  missing any of its three inputs produces nothing and raises no warning,
 *  and a complete 4j1b set is still written when 4j2b is incomplete. There
 *  is no gate requiring all six inputs at once.
 */
class PseudodataSynthesizer
{
  public:
    static const std::vector<std::string> &known_regions();
    static std::string pseudodata_name(const std::string &region);

    static std::vector<HistogramRecord> synthesize(const std::vector<HistogramRecord> &records);

  private:
    static HistogramRecord combine(const HistogramRecord &wjets,
                                   const HistogramRecord &me_var,
                                   const HistogramRecord &ps_var,
                                   const std::string &region);
};

} // namespace histpost

#endif // HISTPOST_ANA_PSEUDODATA_SYNTHESIZER_H
