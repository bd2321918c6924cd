/* -- C++ -- */
/**
 *  @file  io/include/InputManifest.hh
 *
 *  @brief Reader for the `nanoaod_inputs.json` manifest of analysis input
 *         files and their event counts.
 */

#ifndef HISTPOST_IO_INPUT_MANIFEST_H
#define HISTPOST_IO_INPUT_MANIFEST_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ScalingConfig.hh"
#include "ScalingMetadata.hh"

namespace histpost
{

class ManifestError : public std::runtime_error
{
  public:
    explicit ManifestError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

struct ManifestFile
{
    std::string path;
    long long nevts = 0;
};

/** \brief Files of one process/variation with their summed event count. */
struct InputSample
{
    std::string process;
    std::string variation;
    std::vector<std::string> paths;
    long long nevents = 0;
};

class InputManifest
{
  public:
    static const char *const kDefaultPath;

    static InputManifest read(const std::string &path);
    static InputManifest parse(const std::string &json_text);

    const std::string &source() const noexcept { return m_source; }
    std::vector<std::string> processes() const;

    /// Every process/variation except `data`, truncated to `max_files_per_sample` when set.
    std::vector<InputSample> samples(std::optional<size_t> max_files_per_sample = std::nullopt) const;

    /// Events summed over every variation; names compare on lower-cased alphanumerics.
    long long total_events(const std::string &process) const;

    std::optional<long long> events(const std::string &process, const std::string &variation) const;

    /// Nominal event counts of the processes known to `config`.
    ProcessYieldMap by_process(const ScalingConfig &config) const;

    /// Writes `<out_dir>/<process>.json` for every process; returns the paths written.
    std::vector<std::string> write_split(const std::string &out_dir) const;

  private:
    using VariationList = std::vector<std::pair<std::string, std::vector<ManifestFile>>>;

    struct ProcessEntry
    {
        std::string name;
        VariationList variations;
    };

    static std::string normalise_name(const std::string &name);
    static long long sum_events(const VariationList &variations);

    const ProcessEntry *find(const std::string &process) const;

    std::string m_source;
    std::vector<ProcessEntry> m_processes;
};

} // namespace histpost

#endif // HISTPOST_IO_INPUT_MANIFEST_H
