/* -- C++ -- */
/**
 *  @file  core/src/HistogramRecord.cc
 *
 *  @brief Implementation for HistogramRecord.
 */

#include "HistogramRecord.hh"

#include <TAxis.h>
#include <TH1D.h>

#include <stdexcept>
#include <utility>

namespace histpost
{

namespace
{

std::unique_ptr<TH1> detached_clone(const TH1 &hist, const std::string &name)
{
    std::unique_ptr<TH1> out(dynamic_cast<TH1 *>(hist.Clone(name.c_str())));
    if (!out)
    {
        throw std::runtime_error("HistogramRecord: failed to clone histogram " + name);
    }
    out->SetDirectory(nullptr);
    return out;
}

HistogramRecord adopt(TH1D *hist)
{
    std::unique_ptr<TH1> owned(hist);
    owned->SetDirectory(nullptr);
    owned->Sumw2();
    return HistogramRecord(std::move(owned));
}

}

HistogramRecord::HistogramRecord(std::unique_ptr<TH1> hist)
    : m_hist(std::move(hist))
{
    if (!m_hist)
    {
        throw std::invalid_argument("HistogramRecord: null histogram");
    }
    m_hist->SetDirectory(nullptr);
    name = m_hist->GetName();
}

HistogramRecord::HistogramRecord(const HistogramRecord &other)
    : name(other.name),
      region(other.region),
      process(other.process),
      variation(other.variation)
{
    if (other.m_hist)
    {
        m_hist = detached_clone(*other.m_hist, other.m_hist->GetName());
    }
}

HistogramRecord &HistogramRecord::operator=(const HistogramRecord &other)
{
    if (this != &other)
    {
        HistogramRecord copy(other);
        *this = std::move(copy);
    }
    return *this;
}

const TH1 &HistogramRecord::hist() const
{
    if (!m_hist)
    {
        throw std::runtime_error("HistogramRecord: no histogram attached to " + name);
    }
    return *m_hist;
}

TH1 &HistogramRecord::hist()
{
    if (!m_hist)
    {
        throw std::runtime_error("HistogramRecord: no histogram attached to " + name);
    }
    return *m_hist;
}

int HistogramRecord::nbins() const
{
    return hist().GetNbinsX();
}

std::string HistogramRecord::title() const
{
    return hist().GetTitle();
}

std::vector<double> HistogramRecord::edges() const
{
    const TAxis *axis = hist().GetXaxis();
    const int n = axis->GetNbins();
    std::vector<double> out;
    out.reserve(static_cast<size_t>(n) + 1);
    for (int i = 1; i <= n; ++i)
    {
        out.push_back(axis->GetBinLowEdge(i));
    }
    out.push_back(axis->GetBinUpEdge(n));
    return out;
}

std::vector<HistogramBin> HistogramRecord::bins() const
{
    const TH1 &h = hist();
    const int n = h.GetNbinsX();
    std::vector<HistogramBin> out;
    out.reserve(static_cast<size_t>(n));
    for (int i = 1; i <= n; ++i)
    {
        out.push_back({h.GetBinContent(i), h.GetBinError(i)});
    }
    return out;
}

HistogramBin HistogramRecord::underflow() const
{
    return {hist().GetBinContent(0), hist().GetBinError(0)};
}

HistogramBin HistogramRecord::overflow() const
{
    const int n = nbins();
    return {hist().GetBinContent(n + 1), hist().GetBinError(n + 1)};
}

double HistogramRecord::entries() const
{
    return hist().GetEntries();
}

void HistogramRecord::set_bin(int index, double value, double error)
{
    if (index < 0 || index >= nbins())
    {
        throw std::out_of_range("HistogramRecord: bin index out of range for " + name);
    }
    TH1 &h = hist();
    h.SetBinContent(index + 1, value);
    h.SetBinError(index + 1, error);
}

double HistogramRecord::integral() const
{
    return hist().Integral();
}

HistogramRecord HistogramRecord::scaled(double factor) const
{
    HistogramRecord out(*this);
    TH1 &h = out.hist();
    if (h.GetSumw2N() == 0)
    {
        h.Sumw2();
    }
    h.Scale(factor);
    return out;
}

std::unique_ptr<TH1> HistogramRecord::clone_hist(const std::string &new_name) const
{
    return detached_clone(hist(), new_name);
}

HistogramRecord make_uniform_record(const std::string &name, int nbins, double xmin, double xmax)
{
    if (nbins <= 0 || !(xmax > xmin))
    {
        throw std::invalid_argument("make_uniform_record: bad binning for " + name);
    }
    return adopt(new TH1D(name.c_str(), name.c_str(), nbins, xmin, xmax));
}

HistogramRecord make_variable_record(const std::string &name, const std::vector<double> &edges)
{
    if (edges.size() < 2)
    {
        throw std::invalid_argument("make_variable_record: need at least two edges for " + name);
    }
    for (size_t i = 1; i < edges.size(); ++i)
    {
        if (!(edges[i] > edges[i - 1]))
        {
            throw std::invalid_argument("make_variable_record: edges must increase for " + name);
        }
    }
    return adopt(new TH1D(name.c_str(), name.c_str(), static_cast<int>(edges.size() - 1), edges.data()));
}

} // namespace histpost
