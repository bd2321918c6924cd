#include "HistogramMerger.hh"
#include "HistogramRecord.hh"
#include "HistogramStore.hh"
#include "ScalingConfig.hh"
#include "ScalingMetadata.hh"

#include <TH1.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace
{

namespace fs = std::filesystem;

void check(bool cond, const std::string &msg)
{
    if (!cond)
    {
        std::cerr << "FAIL: " << msg << '\n';
        std::exit(1);
    }
}

using namespace histpost;

fs::path scratch_dir()
{
    const fs::path dir = fs::temp_directory_path() / "histpost_test_merger";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

HistogramRecord record(const std::string &name, double first, double second)
{
    HistogramRecord r = make_uniform_record(name, 2, 0.0, 2.0);
    r.set_bin(0, first, 1.0);
    r.set_bin(1, second, 1.0);
    return r;
}

std::string write_shard(const fs::path &dir, const std::string &file, const std::vector<HistogramRecord> &records)
{
    const std::string path = (dir / file).string();
    HistogramStore store = HistogramStore::open_write(path);
    for (const auto &r : records)
    {
        store.write(r);
    }
    store.commit();
    return path;
}

std::vector<std::string> names_of(const std::vector<HistogramRecord> &records)
{
    std::vector<std::string> out;
    for (const auto &r : records)
    {
        out.push_back(r.name);
    }
    return out;
}

long count_name(const std::vector<HistogramRecord> &records, const std::string &name)
{
    return std::count_if(records.begin(), records.end(), [&](const HistogramRecord &r) { return r.name == name; });
}

void test_disjoint_shards_form_a_union()
{
    const fs::path dir = scratch_dir();
    const std::string a = write_shard(dir, "a.root", {record("4j1b_ttbar", 1, 2), record("4j1b_wjets", 3, 4)});
    const std::string b = write_shard(dir, "b.root", {record("4j2b_ttbar_pt_scale_up", 5, 6)});

    const ScalingConfig config = ScalingConfig::defaults();
    const HistogramMerger merger(config);
    const MergedFile merged = merger.merge({a, b});

    const std::vector<std::string> expected = {"4j1b_ttbar", "4j1b_wjets", "4j2b_ttbar_pt_scale_up"};
    check(names_of(merged.records) == expected, "records concatenated in first-seen order");
    check(merged.records[2].region == "4j2b" && merged.records[2].process == "ttbar" &&
              merged.records[2].variation == "pt_scale_up",
          "identity re-derived with the merged-name rule");

    check(merged.metadata.has_value(), "metadata composed");
    check(merged.metadata->histogram_names == expected, "metadata names");
    check(merged.metadata->integrals.at("4j1b_wjets") == 7.0, "metadata integrals");
    check(merged.metadata->lumi == config.lumi(), "metadata lumi");
    check(merged.metadata->by_process.empty(), "no yields without a manifest");
}

void test_shared_name_is_kept_twice()
{
    const fs::path dir = scratch_dir();
    const std::string a = write_shard(dir, "a.root", {record("4j1b_ttbar", 1, 2), record("4j1b_wjets", 1, 1)});
    const std::string b = write_shard(dir, "b.root", {record("4j1b_ttbar", 10, 20)});

    const ScalingConfig config = ScalingConfig::defaults();
    const MergedFile merged = HistogramMerger(config).merge({a, b});
    check(merged.records.size() == 3, "len(A) + len(B) records, nothing summed");
    check(count_name(merged.records, "4j1b_ttbar") == 2, "both copies kept");
    check(merged.records[0].bins()[0].value == 1.0 && merged.records[2].bins()[0].value == 10.0,
          "contents not summed");
    check(merged.warnings.size() == 1 && merged.warnings[0].kind == WarningKind::kDuplicateName,
          "the collision is reported");
    check(merged.warnings[0].histogram_name == "4j1b_ttbar", "the colliding name is reported");
}

void test_names_are_simplified_and_unparseable_dropped()
{
    const fs::path dir = scratch_dir();
    const std::string a = write_shard(dir, "a.root",
                                      {record("4j1b_ttbar_nominal_Jet_pt", 1, 1),
                                       record("4j2b_wjets_Weights_btag", 1, 1),
                                       record("cutflow", 1, 1)});

    const ScalingConfig config = ScalingConfig::defaults();
    const MergedFile merged = HistogramMerger(config).merge({a});
    const std::vector<std::string> expected = {"4j1b_ttbar", "4j2b_wjets"};
    check(names_of(merged.records) == expected, "suffixes stripped and single-token name dropped");
    check(merged.records[0].variation == "nominal", "two tokens means nominal");
    check(merged.warnings.size() == 1 && merged.warnings[0].kind == WarningKind::kUnparseableName &&
              merged.warnings[0].histogram_name == "cutflow",
          "dropped name is reported");
}

void test_missing_shard_is_fatal()
{
    const fs::path dir = scratch_dir();
    const std::string a = write_shard(dir, "a.root", {record("4j1b_ttbar", 1, 2)});
    const std::string missing = (dir / "missing.root").string();

    const ScalingConfig config = ScalingConfig::defaults();
    bool threw = false;
    try
    {
        (void)HistogramMerger(config).merge({a, missing});
    }
    catch (const StoreError &)
    {
        threw = true;
    }
    check(threw, "unreadable shard stops the merge");
}

void test_write_adds_pseudodata_and_metadata()
{
    const fs::path dir = scratch_dir();
    const std::string a = write_shard(dir, "a.root",
                                      {record("4j1b_wjets", 10, 20), record("4j1b_ttbar_ME_var", 2, 4)});
    const std::string b = write_shard(dir, "b.root",
                                      {record("4j1b_ttbar_PS_var", 4, 6), record("4j2b_wjets", 1, 1)});

    const ScalingConfig config = ScalingConfig::defaults();
    ProcessYieldMap yields;
    yields["ttbar"].nevents = 1000000.0;
    yields["ttbar"].xsec = *config.xsec("ttbar");

    const HistogramMerger merger(config);
    const MergedFile merged = merger.merge({a, b}, yields);
    const std::string output = (dir / "merged.root").string();
    const auto pseudodata = merger.write(merged, output);

    check(pseudodata.size() == 1 && pseudodata[0].name == "4j1b_pseudodata", "only the complete region");
    check(!fs::exists(HistogramStore::temp_path(output)), "temp file renamed away");

    HistogramStore in = HistogramStore::open_read(output);
    const auto records = in.list();
    check(records.size() == merged.records.size() + 1, "records plus pseudodata");
    check(records.back().name == "4j1b_pseudodata", "pseudodata written after the merged records");
    check(records.back().bins()[0].value == 13.0 && records.back().bins()[1].value == 25.0, "pseudodata contents");

    const auto meta = in.read_metadata();
    check(meta.has_value() && *meta == *merged.metadata, "metadata written verbatim");
    check(count_name(records, "4j1b_pseudodata") == 1 &&
              std::find(meta->histogram_names.begin(), meta->histogram_names.end(), "4j1b_pseudodata") ==
                  meta->histogram_names.end(),
          "pseudodata is not listed in the metadata");
    check(meta->nevents("ttbar") && *meta->nevents("ttbar") == 1000000.0, "yields recorded");
}

} // namespace

int main()
{
    TH1::AddDirectory(false);
    test_disjoint_shards_form_a_union();
    test_shared_name_is_kept_twice();
    test_names_are_simplified_and_unparseable_dropped();
    test_missing_shard_is_fatal();
    test_write_adds_pseudodata_and_metadata();
    fs::remove_all(fs::temp_directory_path() / "histpost_test_merger");
    std::cout << "test_merger: ok\n";
    return 0;
}
