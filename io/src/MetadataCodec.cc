/* -- C++ -- */
/**
 *  @file  io/src/MetadataCodec.cc
 *
 *  @brief Implementation for the ScalingMetadata JSON codec.
 */

#include "MetadataCodec.hh"

#include <json/json.h>

#include <cmath>
#include <memory>
#include <optional>
#include <utility>

namespace
{

// Event counts are whole numbers in practice; keep them integral on the wire.
Json::Value count_value(double value)
{
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 9.0e15)
    {
        return Json::Value(static_cast<Json::Int64>(value));
    }
    return Json::Value(value);
}

std::optional<double> read_number(const Json::Value &node, const std::string &what)
{
    if (node.isNull())
    {
        return std::nullopt;
    }
    if (!node.isNumeric() || node.isBool())
    {
        throw histpost::MetadataParseError("AGC_metadata: expected a number for " + what);
    }
    return node.asDouble();
}

const Json::Value &require_kind(const Json::Value &node, Json::ValueType kind, const std::string &what)
{
    if (node.type() != kind)
    {
        throw histpost::MetadataParseError("AGC_metadata: unexpected JSON type for " + what);
    }
    return node;
}

}

namespace histpost
{

const char *const MetadataCodec::kMetadataKey = "AGC_metadata";

std::string MetadataCodec::encode(const ScalingMetadata &metadata)
{
    Json::Value root(Json::objectValue);

    Json::Value names(Json::arrayValue);
    for (const auto &name : metadata.histogram_names)
    {
        names.append(name);
    }
    root["histogram_names"] = names;

    Json::Value integrals(Json::objectValue);
    for (const auto &kv : metadata.integrals)
    {
        integrals[kv.first] = (kv.second && std::isfinite(*kv.second)) ? Json::Value(*kv.second)
                                                                      : Json::Value(Json::nullValue);
    }
    root["integrals"] = integrals;

    root["lumi"] = metadata.lumi;

    Json::Value by_process(Json::objectValue);
    for (const auto &kv : metadata.by_process)
    {
        Json::Value entry(Json::objectValue);
        entry["variation"] = kv.second.variation;
        entry["nevents"] = count_value(kv.second.nevents);
        entry["xsec"] = kv.second.xsec;
        by_process[kv.first] = entry;
    }
    root["by_process"] = by_process;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

ScalingMetadata MetadataCodec::decode(const std::string &text)
{
    Json::Value root;
    std::string errors;
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
    {
        throw MetadataParseError("AGC_metadata: malformed JSON: " + errors);
    }
    if (!root.isObject())
    {
        throw MetadataParseError("AGC_metadata: top level must be a JSON object");
    }

    ScalingMetadata out;

    if (root.isMember("histogram_names"))
    {
        for (const auto &item : require_kind(root["histogram_names"], Json::arrayValue, "histogram_names"))
        {
            if (!item.isString())
            {
                throw MetadataParseError("AGC_metadata: histogram_names must hold strings");
            }
            out.histogram_names.push_back(item.asString());
        }
    }

    if (root.isMember("integrals"))
    {
        const Json::Value &integrals = require_kind(root["integrals"], Json::objectValue, "integrals");
        for (const auto &name : integrals.getMemberNames())
        {
            out.integrals[name] = read_number(integrals[name], "integral of " + name);
        }
    }

    if (root.isMember("lumi"))
    {
        out.lumi = read_number(root["lumi"], "lumi").value_or(0.0);
    }

    if (root.isMember("by_process"))
    {
        const Json::Value &by_process = require_kind(root["by_process"], Json::objectValue, "by_process");
        for (const auto &process : by_process.getMemberNames())
        {
            const Json::Value &entry = by_process[process];
            if (!entry.isObject())
            {
                throw MetadataParseError("AGC_metadata: by_process entries must be objects");
            }

            ProcessYield yield;
            if (entry.isMember("variation"))
            {
                yield.variation = require_kind(entry["variation"], Json::stringValue,
                                               "variation of " + process).asString();
            }
            if (entry.isMember("nevents"))
            {
                yield.nevents = read_number(entry["nevents"], "nevents of " + process).value_or(0.0);
            }
            if (entry.isMember("xsec"))
            {
                yield.xsec = read_number(entry["xsec"], "xsec of " + process).value_or(0.0);
            }
            out.by_process[process] = yield;
        }
    }

    return out;
}

ScalingMetadata MetadataCodec::compose(const std::vector<HistogramRecord> &records,
                                       const ScalingConfig &config,
                                       const ProcessYieldMap &by_process)
{
    ScalingMetadata out;
    out.by_process = by_process;
    out.lumi = config.lumi();
    out.histogram_names.reserve(records.size());
    for (const auto &record : records)
    {
        out.histogram_names.push_back(record.name);
        const double integral = record.integral();
        if (std::isfinite(integral))
        {
            out.integrals[record.name] = integral;
        }
        else
        {
            out.integrals[record.name] = std::nullopt;
        }
    }
    return out;
}

} // namespace histpost
