/* -- C++ -- */
/**
 *  @file  core/src/HistogramWarning.cc
 *
 *  @brief Names and classification of histogram warning kinds.
 */

#include "HistogramWarning.hh"

namespace histpost
{

const char *warning_kind_name(WarningKind kind)
{
    switch (kind)
    {
    case WarningKind::kUnparseableName:
        return "unparseable_name";
    case WarningKind::kUnknownProcess:
        return "unknown_process";
    case WarningKind::kZeroIntegral:
        return "zero_integral";
    case WarningKind::kAlreadyAtTarget:
        return "already_at_target";
    case WarningKind::kMetadataDecodeFailure:
        return "metadata_decode_failure";
    case WarningKind::kDuplicateName:
        return "duplicate_name";
    default:
        return "unknown";
    }
}

bool is_informational(WarningKind kind)
{
    return kind == WarningKind::kZeroIntegral || kind == WarningKind::kAlreadyAtTarget;
}

} // namespace histpost
