/* -- C++ -- */
/**
 *  @file  core/include/NameCodec.hh
 *
 *  @brief Flat histogram name encoding `<region>_<process>_<variation>`.
 *
 *  Two reading rules coexist. `parse_merged_name` is applied when shard
 *  outputs are loaded for merging, `parse_scaled_name` when merged files are
 *  normalised. They disagree on multi-token process names (for example
 *  `4j1b_single_top_tW`) and are kept apart on purpose.
 */

#ifndef HISTPOST_CORE_NAME_CODEC_H
#define HISTPOST_CORE_NAME_CODEC_H

#include <optional>
#include <string>
#include <vector>

namespace histpost
{

struct HistogramIdentity
{
    std::string region;
    std::string process;
    std::string variation;
};

inline bool operator==(const HistogramIdentity &a, const HistogramIdentity &b)
{
    return a.region == b.region && a.process == b.process && a.variation == b.variation;
}

class NameCodec
{
  public:
    static const char *const kNominal;

    /// region = first token, process = second, variation = the rest (or nominal).
    static std::optional<HistogramIdentity> parse_merged_name(const std::string &name);

    /// region = first token, variation = trailing up/down (or nominal), process = the middle.
    static std::optional<HistogramIdentity> parse_scaled_name(const std::string &name);

    /// Drops `_nominal` and truncates at `_Jet` / `_Weights` suffixes.
    static std::string simplify(const std::string &name);

    static std::string join(const HistogramIdentity &id);

    static std::vector<std::string> split_tokens(const std::string &name);

  private:
    static std::string join_tokens(const std::vector<std::string> &tokens, size_t begin, size_t end);
};

} // namespace histpost

#endif // HISTPOST_CORE_NAME_CODEC_H
