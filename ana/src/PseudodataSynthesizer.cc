/* -- C++ -- */
/**
 *  @file  ana/src/PseudodataSynthesizer.cc
 *
 *  @brief Implementation for the pseudodata synthesis.
 */

#include "PseudodataSynthesizer.hh"

#include <map>
#include <memory>
#include <stdexcept>
#include <utility>

#include <TH1.h>

#include "NameCodec.hh"

namespace
{

const double kVariationWeight = 0.5;

}

namespace histpost
{

const std::vector<std::string> &PseudodataSynthesizer::known_regions()
{
    static const std::vector<std::string> regions = {"4j1b", "4j2b"};
    return regions;
}

std::string PseudodataSynthesizer::pseudodata_name(const std::string &region)
{
    return region + "_pseudodata";
}

std::vector<HistogramRecord> PseudodataSynthesizer::synthesize(const std::vector<HistogramRecord> &records)
{
    std::map<std::string, const HistogramRecord *> by_name;
    for (const auto &record : records)
    {
        by_name.emplace(record.name, &record);
    }

    std::vector<HistogramRecord> out;
    for (const auto &region : known_regions())
    {
        const auto wjets = by_name.find(region + "_wjets");
        const auto me_var = by_name.find(region + "_ttbar_ME_var");
        const auto ps_var = by_name.find(region + "_ttbar_PS_var");
        if (wjets == by_name.end() || me_var == by_name.end() || ps_var == by_name.end())
        {
            continue;
        }
        out.push_back(combine(*wjets->second, *me_var->second, *ps_var->second, region));
    }
    return out;
}

HistogramRecord PseudodataSynthesizer::combine(const HistogramRecord &wjets,
                                               const HistogramRecord &me_var,
                                               const HistogramRecord &ps_var,
                                               const std::string &region)
{
    if (wjets.nbins() != me_var.nbins() || wjets.nbins() != ps_var.nbins())
    {
        throw std::invalid_argument("PseudodataSynthesizer: incompatible binning in region " + region);
    }

    std::unique_ptr<TH1> sum = wjets.clone_hist(pseudodata_name(region));
    if (sum->GetSumw2N() == 0)
    {
        sum->Sumw2();
    }
    if (!sum->Add(&ps_var.hist(), kVariationWeight) || !sum->Add(&me_var.hist(), kVariationWeight))
    {
        throw std::invalid_argument("PseudodataSynthesizer: cannot add variations in region " + region);
    }

    HistogramRecord out(std::move(sum));
    out.region = region;
    out.process = "pseudodata";
    out.variation = NameCodec::kNominal;
    return out;
}

} // namespace histpost
