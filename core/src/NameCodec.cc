/* -- C++ -- */
/**
 *  @file  core/src/NameCodec.cc
 *
 *  @brief Implementation for the flat histogram name encoding.
 */

#include "NameCodec.hh"

namespace histpost
{

const char *const NameCodec::kNominal = "nominal";

std::vector<std::string> NameCodec::split_tokens(const std::string &name)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= name.size())
    {
        const size_t pos = name.find('_', start);
        if (pos == std::string::npos)
        {
            out.push_back(name.substr(start));
            break;
        }
        out.push_back(name.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::string NameCodec::join_tokens(const std::vector<std::string> &tokens, size_t begin, size_t end)
{
    std::string out;
    for (size_t i = begin; i < end && i < tokens.size(); ++i)
    {
        if (i != begin)
        {
            out += '_';
        }
        out += tokens[i];
    }
    return out;
}

std::optional<HistogramIdentity> NameCodec::parse_merged_name(const std::string &name)
{
    const auto tokens = split_tokens(name);
    if (tokens.size() < 2)
    {
        return std::nullopt;
    }

    HistogramIdentity id;
    id.region = tokens[0];
    id.process = tokens[1];
    if (tokens.size() >= 3)
    {
        id.variation = join_tokens(tokens, 2, tokens.size());
    }
    else
    {
        id.variation = kNominal;
    }
    return id;
}

std::optional<HistogramIdentity> NameCodec::parse_scaled_name(const std::string &name)
{
    const auto tokens = split_tokens(name);
    if (tokens.size() < 2)
    {
        return std::nullopt;
    }

    HistogramIdentity id;
    id.region = tokens[0];
    const std::string &last = tokens.back();
    if (last == "up" || last == "down")
    {
        id.variation = last;
        id.process = join_tokens(tokens, 1, tokens.size() - 1);
    }
    else
    {
        id.variation = kNominal;
        id.process = join_tokens(tokens, 1, tokens.size());
    }
    return id;
}

std::string NameCodec::simplify(const std::string &name)
{
    static const std::string nominal_tag = "_nominal";

    std::string out = name;
    size_t pos = out.find(nominal_tag);
    while (pos != std::string::npos)
    {
        out.erase(pos, nominal_tag.size());
        pos = out.find(nominal_tag, pos);
    }

    for (const char *suffix : {"_Jet", "_Weights"})
    {
        const size_t cut = out.find(suffix);
        if (cut != std::string::npos)
        {
            out.erase(cut);
        }
    }
    return out;
}

std::string NameCodec::join(const HistogramIdentity &id)
{
    std::string out = id.region + "_" + id.process;
    if (!id.variation.empty() && id.variation != kNominal)
    {
        out += "_" + id.variation;
    }
    return out;
}

} // namespace histpost
