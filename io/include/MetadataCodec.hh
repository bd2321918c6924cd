/* -- C++ -- */
/**
 *  @file  io/include/MetadataCodec.hh
 *
 *  @brief JSON encoding of ScalingMetadata stored as the `AGC_metadata` blob.
 */

#ifndef HISTPOST_IO_METADATA_CODEC_H
#define HISTPOST_IO_METADATA_CODEC_H

#include <stdexcept>
#include <string>
#include <vector>

#include "HistogramRecord.hh"
#include "ScalingConfig.hh"
#include "ScalingMetadata.hh"

namespace histpost
{

class MetadataParseError : public std::runtime_error
{
  public:
    explicit MetadataParseError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

class MetadataCodec
{
  public:
    static const char *const kMetadataKey;

    static std::string encode(const ScalingMetadata &metadata);

    /// Throws MetadataParseError on malformed JSON or mistyped fields.
    static ScalingMetadata decode(const std::string &text);

    /// Names, integrals and lumi of `records`, plus the supplied per-process yields.
    static ScalingMetadata compose(const std::vector<HistogramRecord> &records,
                                   const ScalingConfig &config,
                                   const ProcessYieldMap &by_process = {});
};

} // namespace histpost

#endif // HISTPOST_IO_METADATA_CODEC_H
