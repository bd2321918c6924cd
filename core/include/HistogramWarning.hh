/* -- C++ -- */
/**
 *  @file  core/include/HistogramWarning.hh
 *
 *  @brief Recoverable per-histogram conditions raised while merging and
 *         scaling.
 */

#ifndef HISTPOST_CORE_HISTOGRAM_WARNING_H
#define HISTPOST_CORE_HISTOGRAM_WARNING_H

#include <string>
#include <utility>
#include <vector>

namespace histpost
{

enum class WarningKind
{
    kUnparseableName,
    kUnknownProcess,
    kZeroIntegral,
    kAlreadyAtTarget,
    kMetadataDecodeFailure,
    kDuplicateName
};

const char *warning_kind_name(WarningKind kind);

/// Informational kinds describe histograms that are fine as they are.
bool is_informational(WarningKind kind);

struct HistogramWarning
{
    WarningKind kind;
    std::string histogram_name;

    /// Numeric or textual context, logged as key=value pairs in order.
    std::vector<std::pair<std::string, std::string>> context;
};

} // namespace histpost

#endif // HISTPOST_CORE_HISTOGRAM_WARNING_H
