/* -- C++ -- */
/**
 *  @file  io/include/HistogramStore.hh
 *
 *  @brief ROOT container of named histograms plus one `AGC_metadata` blob.
 *
 *  Write handles never touch the destination until commit(): objects go to
 *  `<destination>.tmp`, which is renamed over the destination on success and
 *  removed when the handle is destroyed without a commit.
 */

#ifndef HISTPOST_IO_HISTOGRAM_STORE_H
#define HISTPOST_IO_HISTOGRAM_STORE_H

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "HistogramRecord.hh"
#include "ScalingMetadata.hh"

class TFile;

namespace histpost
{

class StoreError : public std::runtime_error
{
  public:
    explicit StoreError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

class HistogramStore
{
  public:
    enum class Mode
    {
        kRead,
        kWrite
    };

    /// Throws StoreError when the file is missing or unreadable.
    static HistogramStore open_read(const std::string &path);
    static HistogramStore open_write(const std::string &destination);

    static std::string temp_path(const std::string &destination);
    static std::string scaled_sibling(const std::string &path);

    HistogramStore(HistogramStore &&other) noexcept;
    HistogramStore &operator=(HistogramStore &&) = delete;
    HistogramStore(const HistogramStore &) = delete;
    HistogramStore &operator=(const HistogramStore &) = delete;
    ~HistogramStore();

    const std::string &path() const noexcept { return m_path; }
    Mode mode() const noexcept { return m_mode; }
    bool is_open() const noexcept { return static_cast<bool>(m_file); }

    /// One-dimensional histograms in key order, every cycle included. Each
    /// record owns a detached clone of the stored object and is named after
    /// its key.
    std::vector<HistogramRecord> list() const;

    /// Keys of objects that are not one-dimensional histograms.
    std::vector<std::string> passthrough_keys() const;

    /// Raw JSON blob, or nullopt when the file carries none.
    std::optional<std::string> read_metadata_blob() const;

    /// Decoded metadata; throws MetadataParseError when the blob is malformed.
    std::optional<ScalingMetadata> read_metadata() const;

    /// Writes the record's histogram, class and axis decoration intact, under `record.name`.
    void write(const HistogramRecord &record);
    void write_metadata(const ScalingMetadata &metadata);

    /// Copies every passthrough object of `source` verbatim.
    void copy_passthrough(const HistogramStore &source);

    /// Closes and renames the temporary file onto the destination.
    void commit();

    /// Closes a read handle, or discards the temporary file of an uncommitted write handle.
    void close();

  private:
    HistogramStore(std::string path, std::string file_path, Mode mode, std::unique_ptr<TFile> file);

    void require(Mode mode, const char *what) const;

    std::string m_path;
    std::string m_file_path;
    Mode m_mode;
    std::unique_ptr<TFile> m_file;
};

} // namespace histpost

#endif // HISTPOST_IO_HISTOGRAM_STORE_H
