/* -- C++ -- */
/**
 *  @file  io/src/InputManifest.cc
 *
 *  @brief Implementation for the input manifest reader.
 */

#include "InputManifest.hh"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace histpost
{

const char *const InputManifest::kDefaultPath = "nanoaod_inputs.json";

InputManifest InputManifest::read(const std::string &path)
{
    std::ifstream fin(path);
    if (!fin)
    {
        throw ManifestError("Input manifest not found: " + path);
    }
    std::ostringstream buffer;
    buffer << fin.rdbuf();

    InputManifest out = parse(buffer.str());
    out.m_source = path;
    return out;
}

InputManifest InputManifest::parse(const std::string &json_text)
{
    Json::Value root;
    std::string errors;
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors))
    {
        throw ManifestError("Malformed input manifest: " + errors);
    }
    if (!root.isObject())
    {
        throw ManifestError("Input manifest must be an object keyed by process");
    }

    InputManifest out;
    for (const auto &process : root.getMemberNames())
    {
        const Json::Value &variations = root[process];
        if (!variations.isObject())
        {
            throw ManifestError("Input manifest entry " + process + " must be an object keyed by variation");
        }

        ProcessEntry entry;
        entry.name = process;
        for (const auto &variation : variations.getMemberNames())
        {
            const Json::Value &var = variations[variation];
            if (!var.isObject() || !var["files"].isArray())
            {
                throw ManifestError("Input manifest entry " + process + "/" + variation +
                                    " has no files list");
            }

            std::vector<ManifestFile> listed;
            for (const auto &file : var["files"])
            {
                const Json::Value &path = file.isObject() ? file["path"] : Json::Value::nullSingleton();
                if (!path.isString() || path.asString().empty())
                {
                    throw ManifestError("Input manifest file without path in " + process + "/" + variation);
                }

                ManifestFile mf;
                mf.path = path.asString();
                const Json::Value &nevts = file["nevts"];
                if (!nevts.isNull())
                {
                    if (nevts.isBool() || !nevts.isIntegral())
                    {
                        throw ManifestError("Input manifest has non-integer nevts for " + mf.path);
                    }
                    mf.nevts = nevts.asInt64();
                }
                listed.push_back(std::move(mf));
            }
            entry.variations.emplace_back(variation, std::move(listed));
        }
        out.m_processes.push_back(std::move(entry));
    }
    return out;
}

std::vector<std::string> InputManifest::processes() const
{
    std::vector<std::string> out;
    out.reserve(m_processes.size());
    for (const auto &entry : m_processes)
    {
        out.push_back(entry.name);
    }
    return out;
}

std::vector<InputSample> InputManifest::samples(std::optional<size_t> max_files_per_sample) const
{
    std::vector<InputSample> out;
    for (const auto &entry : m_processes)
    {
        if (entry.name == "data")
        {
            continue;
        }
        for (const auto &var : entry.variations)
        {
            InputSample sample;
            sample.process = entry.name;
            sample.variation = var.first;

            size_t n = var.second.size();
            if (max_files_per_sample)
            {
                n = std::min(n, *max_files_per_sample);
            }
            for (size_t i = 0; i < n; ++i)
            {
                sample.paths.push_back(var.second[i].path);
                sample.nevents += var.second[i].nevts;
            }
            out.push_back(std::move(sample));
        }
    }
    return out;
}

std::string InputManifest::normalise_name(const std::string &name)
{
    std::string out;
    for (unsigned char c : name)
    {
        if (std::isalnum(c))
        {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

long long InputManifest::sum_events(const VariationList &variations)
{
    long long total = 0;
    for (const auto &var : variations)
    {
        for (const auto &file : var.second)
        {
            total += file.nevts;
        }
    }
    return total;
}

long long InputManifest::total_events(const std::string &process) const
{
    const std::string target = normalise_name(process);

    long long total = 0;
    bool found = false;
    for (const auto &entry : m_processes)
    {
        if (normalise_name(entry.name) != target)
        {
            continue;
        }
        found = true;
        total += sum_events(entry.variations);
    }

    if (!found)
    {
        for (const auto &entry : m_processes)
        {
            if (normalise_name(entry.name).find(target) != std::string::npos)
            {
                total += sum_events(entry.variations);
            }
        }
    }
    return total;
}

const InputManifest::ProcessEntry *InputManifest::find(const std::string &process) const
{
    for (const auto &entry : m_processes)
    {
        if (entry.name == process)
        {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<long long> InputManifest::events(const std::string &process, const std::string &variation) const
{
    const ProcessEntry *entry = find(process);
    if (!entry)
    {
        return std::nullopt;
    }
    for (const auto &var : entry->variations)
    {
        if (var.first != variation)
        {
            continue;
        }
        long long total = 0;
        for (const auto &file : var.second)
        {
            total += file.nevts;
        }
        return total;
    }
    return std::nullopt;
}

ProcessYieldMap InputManifest::by_process(const ScalingConfig &config) const
{
    ProcessYieldMap out;
    for (const auto &kv : config.xsec_table())
    {
        const auto nominal = events(kv.first, "nominal");
        const long long nevents = nominal ? *nominal : total_events(kv.first);
        if (nevents <= 0)
        {
            continue;
        }

        ProcessYield yield;
        yield.variation = "nominal";
        yield.nevents = static_cast<double>(nevents);
        yield.xsec = kv.second;
        out[kv.first] = yield;
    }
    return out;
}

std::vector<std::string> InputManifest::write_split(const std::string &out_dir) const
{
    std::filesystem::create_directories(out_dir);

    std::vector<std::string> written;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";

    for (const auto &entry : m_processes)
    {
        Json::Value variations(Json::objectValue);
        for (const auto &var : entry.variations)
        {
            Json::Value files(Json::arrayValue);
            for (const auto &file : var.second)
            {
                Json::Value item(Json::objectValue);
                item["path"] = file.path;
                item["nevts"] = static_cast<Json::Int64>(file.nevts);
                files.append(item);
            }
            variations[var.first]["files"] = files;
        }
        Json::Value root(Json::objectValue);
        root[entry.name] = variations;

        const std::string path = (std::filesystem::path(out_dir) / (entry.name + ".json")).string();
        std::ofstream fout(path, std::ios::trunc);
        if (!fout)
        {
            throw ManifestError("Failed to open split manifest for writing: " + path);
        }
        fout << Json::writeString(builder, root) << "\n";
        if (!fout)
        {
            throw ManifestError("Failed to write split manifest: " + path);
        }
        written.push_back(path);
    }
    return written;
}

} // namespace histpost
