/* -- C++ -- */
/**
 *  @file  core/include/HistogramRecord.hh
 *
 *  @brief One-dimensional histogram detached from its container file,
 *         together with its region/process/variation identity.
 */

#ifndef HISTPOST_CORE_HISTOGRAM_RECORD_H
#define HISTPOST_CORE_HISTOGRAM_RECORD_H

#include <TH1.h> // complete type for std::unique_ptr<TH1> destruction in user TUs

#include <memory>
#include <string>
#include <vector>

namespace histpost
{

struct HistogramBin
{
    double value = 0.0;
    double error = 0.0;
};

inline bool operator==(const HistogramBin &a, const HistogramBin &b)
{
    return a.value == b.value && a.error == b.error;
}

inline bool operator!=(const HistogramBin &a, const HistogramBin &b)
{
    return !(a == b);
}

/** \brief Named histogram owning a detached clone of the stored object.
 *
 *  The clone keeps the stored class, axis attributes, bin labels and
 *  statistics, so a record written back unscaled is the object that was
 *  read. `name` is the key the record is written under and may differ from
 *  the object name until then. Copies clone the histogram.
 */
class HistogramRecord
{
  public:
    std::string name;
    std::string region;
    std::string process;
    std::string variation;

    HistogramRecord() = default;
    explicit HistogramRecord(std::unique_ptr<TH1> hist);

    HistogramRecord(const HistogramRecord &other);
    HistogramRecord &operator=(const HistogramRecord &other);
    HistogramRecord(HistogramRecord &&) noexcept = default;
    HistogramRecord &operator=(HistogramRecord &&) noexcept = default;
    ~HistogramRecord() = default;

    bool has_hist() const noexcept { return static_cast<bool>(m_hist); }
    const TH1 &hist() const;
    TH1 &hist();

    int nbins() const;
    std::string title() const;
    std::vector<double> edges() const;

    /// In-range bins, first to last.
    std::vector<HistogramBin> bins() const;
    HistogramBin underflow() const;
    HistogramBin overflow() const;
    double entries() const;

    /// `index` counts in-range bins from 0, as in bins().
    void set_bin(int index, double value, double error);

    /// TH1::Integral(): in-range bins only.
    double integral() const;

    /// Clone with contents and errors multiplied by `factor`, flow bins included.
    HistogramRecord scaled(double factor) const;

    /// Detached clone of the histogram, renamed to `new_name`.
    std::unique_ptr<TH1> clone_hist(const std::string &new_name) const;

  private:
    std::unique_ptr<TH1> m_hist;
};

/// Empty TH1D-backed record with errors tracked per bin.
HistogramRecord make_uniform_record(const std::string &name, int nbins, double xmin, double xmax);
HistogramRecord make_variable_record(const std::string &name, const std::vector<double> &edges);

} // namespace histpost

#endif // HISTPOST_CORE_HISTOGRAM_RECORD_H
