#include "HistogramRecord.hh"
#include "HistogramStore.hh"
#include "MetadataCodec.hh"
#include "ScalingMetadata.hh"

#include <TAxis.h>
#include <TDirectory.h>
#include <TFile.h>
#include <TH1.h>
#include <TH1D.h>
#include <TH1F.h>
#include <TH2D.h>
#include <TNamed.h>
#include <TObjString.h>
#include <TTree.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
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

bool close_to(double a, double b) { return std::fabs(a - b) <= 1e-12 * std::fmax(1.0, std::fabs(b)); }

bool contains(const std::vector<std::string> &names, const std::string &name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

using namespace histpost;

fs::path scratch_dir()
{
    const fs::path dir = fs::temp_directory_path() / "histpost_test_histogram_store";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

HistogramRecord sample_record(const std::string &name)
{
    HistogramRecord record = make_variable_record(name, {0.0, 50.0, 120.0, 300.0});
    TH1 &hist = record.hist();
    hist.SetTitle("m_{bjj}");
    record.set_bin(0, 4.0, 2.0);
    record.set_bin(1, 9.0, 3.0);
    record.set_bin(2, 0.5, 0.25);
    hist.SetBinContent(0, 1.0);
    hist.SetBinError(0, 1.0);
    hist.SetBinContent(4, 2.0);
    hist.SetBinError(4, 0.5);
    hist.SetEntries(17.0);
    return record;
}

// Mixed content written with plain ROOT, as an upstream job would leave it.
void write_fixture(const fs::path &path)
{
    TFile f(path.c_str(), "RECREATE");

    TH1D h1("4j1b_ttbar", "", 2, 0.0, 2.0);
    h1.SetDirectory(nullptr);
    h1.SetBinContent(1, 5.0);
    h1.SetBinContent(2, 7.0);
    f.WriteTObject(&h1, "4j1b_ttbar");

    TH2D h2("4j1b_ttbar_2d", "", 2, 0.0, 2.0, 2, 0.0, 2.0);
    h2.SetDirectory(nullptr);
    h2.Fill(0.5, 0.5);
    f.WriteTObject(&h2, "4j1b_ttbar_2d");

    TObjString note("produced by test");
    f.WriteTObject(&note, "note");

    f.cd();
    auto *tree = new TTree("events", "events");
    double x = 0.0;
    tree->Branch("x", &x);
    for (int i = 0; i < 10; ++i)
    {
        x = i;
        tree->Fill();
    }
    tree->Write();

    TDirectory *sub = f.mkdir("cutflow");
    TNamed info("selection", "4j1b");
    sub->WriteTObject(&info, "selection");

    f.Close();
}

void test_commit_renames_temp_file()
{
    const fs::path dir = scratch_dir();
    const std::string dest = (dir / "merged.root").string();

    ScalingMetadata meta;
    meta.lumi = 3378.0;
    meta.histogram_names = {"4j1b_ttbar", "4j2b_wjets"};
    meta.integrals["4j1b_ttbar"] = 13.5;
    meta.integrals["4j2b_wjets"] = std::nullopt;

    {
        HistogramStore out = HistogramStore::open_write(dest);
        check(out.mode() == HistogramStore::Mode::kWrite, "write mode");
        check(fs::exists(HistogramStore::temp_path(dest)), "writes go to the temp file");
        check(!fs::exists(dest), "destination untouched before commit");
        out.write(sample_record("4j1b_ttbar"));
        out.write(sample_record("4j2b_wjets"));
        out.write_metadata(meta);
        out.commit();
        check(!out.is_open(), "commit closes the handle");
    }
    check(fs::exists(dest), "destination exists after commit");
    check(!fs::exists(HistogramStore::temp_path(dest)), "temp file gone after commit");

    HistogramStore in = HistogramStore::open_read(dest);
    const auto records = in.list();
    check(records.size() == 2, "two histograms");
    const HistogramRecord expected = sample_record("4j1b_ttbar");
    const auto found = std::find_if(records.begin(), records.end(),
                                    [](const HistogramRecord &r) { return r.name == "4j1b_ttbar"; });
    check(found != records.end(), "written histogram listed");
    const HistogramRecord &got = *found;
    check(got.title() == expected.title(), "title");
    check(got.region == "4j1b" && got.process == "ttbar" && got.variation == "nominal", "identity from the name");
    check(got.edges() == expected.edges(), "variable binning survives");
    const auto got_bins = got.bins();
    const auto expected_bins = expected.bins();
    for (size_t i = 0; i < expected_bins.size(); ++i)
    {
        check(got_bins[i].value == expected_bins[i].value, "bin content");
        check(close_to(got_bins[i].error, expected_bins[i].error), "bin error");
    }
    check(got.underflow().value == 1.0 && got.overflow().value == 2.0, "flow bins survive");
    check(got.entries() == 17.0, "entries survive");
    check(close_to(got.integral(), 13.5), "integral ignores flow bins");

    const auto back = in.read_metadata();
    check(back.has_value() && *back == meta, "metadata read back");
    check(contains(in.passthrough_keys(), MetadataCodec::kMetadataKey), "metadata is not a histogram");
}

void test_uncommitted_write_is_discarded()
{
    const fs::path dir = scratch_dir();
    const std::string dest = (dir / "never.root").string();

    {
        HistogramStore out = HistogramStore::open_write(dest);
        out.write(sample_record("4j1b_ttbar"));
    }
    check(!fs::exists(dest), "no destination without commit");
    check(!fs::exists(HistogramStore::temp_path(dest)), "temp file removed on destruction");

    {
        HistogramStore out = HistogramStore::open_write(dest);
        out.close();
        check(!out.is_open(), "closed");
    }
    check(!fs::exists(HistogramStore::temp_path(dest)), "temp file removed on close");
}

void test_existing_destination_survives_a_failed_write()
{
    const fs::path dir = scratch_dir();
    const std::string dest = (dir / "input.root").string();
    write_fixture(dest);
    const auto size_before = fs::file_size(dest);

    {
        HistogramStore out = HistogramStore::open_write(dest);
        out.write(sample_record("4j1b_ttbar"));
    }
    check(fs::file_size(dest) == size_before, "existing destination left intact");
    HistogramStore in = HistogramStore::open_read(dest);
    check(in.list().size() == 1, "existing content still readable");
}

void test_list_and_passthrough()
{
    const fs::path dir = scratch_dir();
    const std::string src_path = (dir / "mixed.root").string();
    write_fixture(src_path);

    HistogramStore in = HistogramStore::open_read(src_path);
    const auto records = in.list();
    check(records.size() == 1 && records[0].name == "4j1b_ttbar", "only the 1D histogram is a record");
    check(records[0].integral() == 12.0, "contents read");

    const auto keys = in.passthrough_keys();
    check(contains(keys, "4j1b_ttbar_2d"), "2D histogram passes through");
    check(contains(keys, "note"), "string passes through");
    check(contains(keys, "events"), "tree passes through");
    check(contains(keys, "cutflow"), "directory passes through");
    check(!contains(keys, "4j1b_ttbar"), "1D histogram is not passthrough");
    check(!in.read_metadata().has_value(), "no metadata blob");

    const std::string out_path = (dir / "copy.root").string();

    {
        HistogramStore out = HistogramStore::open_write(out_path);
        out.copy_passthrough(in);
        out.commit();
    }

    TFile f(out_path.c_str(), "READ");
    check(!f.IsZombie(), "copy readable");
    check(f.Get("4j1b_ttbar") == nullptr, "histograms are not copied as passthrough");
    auto *h2 = dynamic_cast<TH2D *>(f.Get("4j1b_ttbar_2d"));
    check(h2 != nullptr && h2->GetEntries() == 1.0, "2D histogram copied");
    auto *note = dynamic_cast<TObjString *>(f.Get("note"));
    check(note != nullptr && note->GetString() == "produced by test", "string copied verbatim");
    auto *tree = dynamic_cast<TTree *>(f.Get("events"));
    check(tree != nullptr && tree->GetEntries() == 10, "tree copied with all entries");
    auto *info = dynamic_cast<TNamed *>(f.Get("cutflow/selection"));
    check(info != nullptr && std::string(info->GetTitle()) == "4j1b", "directory contents copied");
    f.Close();
}

void test_every_cycle_is_listed()
{
    const fs::path dir = scratch_dir();
    const std::string dest = (dir / "cycles.root").string();

    {
        HistogramStore out = HistogramStore::open_write(dest);
        out.write(sample_record("4j1b_ttbar"));
        out.write(sample_record("4j1b_ttbar"));
        out.commit();
    }
    HistogramStore in = HistogramStore::open_read(dest);
    check(in.list().size() == 2, "both cycles are records");
}

void test_metadata_under_wrong_type()
{
    const fs::path dir = scratch_dir();
    const std::string path = (dir / "badmeta.root").string();

    {
        TFile f(path.c_str(), "RECREATE");
        TNamed wrong("AGC_metadata", "{}");
        f.WriteTObject(&wrong, MetadataCodec::kMetadataKey);
        f.Close();
    }
    HistogramStore in = HistogramStore::open_read(path);
    bool threw = false;
    try
    {
        (void)in.read_metadata();
    }
    catch (const MetadataParseError &)
    {
        threw = true;
    }
    check(threw, "non-string metadata is a parse error");

    const std::string garbled = (dir / "garbled.root").string();

    {
        TFile f(garbled.c_str(), "RECREATE");
        TObjString blob("{\"lumi\": ");
        f.WriteTObject(&blob, MetadataCodec::kMetadataKey);
        f.Close();
    }
    HistogramStore in2 = HistogramStore::open_read(garbled);
    check(in2.read_metadata_blob().has_value(), "raw blob is available");
    threw = false;
    try
    {
        (void)in2.read_metadata();
    }
    catch (const MetadataParseError &)
    {
        threw = true;
    }
    check(threw, "malformed JSON is a parse error");
}

void test_open_failures()
{
    const fs::path dir = scratch_dir();
    bool threw = false;
    try
    {
        (void)HistogramStore::open_read((dir / "missing.root").string());
    }
    catch (const StoreError &)
    {
        threw = true;
    }
    check(threw, "missing file");

    const fs::path text = dir / "notroot.root";

    {
        std::ofstream out(text);
        out << "this is not a ROOT file\n";
    }
    threw = false;
    try
    {
        (void)HistogramStore::open_read(text.string());
    }
    catch (const StoreError &)
    {
        threw = true;
    }
    check(threw, "zombie file");

    threw = false;
    try
    {
        (void)HistogramStore::open_write((dir / "no_such_dir" / "out.root").string());
    }
    catch (const StoreError &)
    {
        threw = true;
    }
    check(threw, "unwritable destination");
}

void test_wrong_mode_is_rejected()
{
    const fs::path dir = scratch_dir();
    const std::string dest = (dir / "mode.root").string();
    HistogramStore out = HistogramStore::open_write(dest);
    bool threw = false;
    try
    {
        (void)out.list();
    }
    catch (const StoreError &)
    {
        threw = true;
    }
    check(threw, "list on a write handle");
}

void test_scaled_sibling()
{
    check(HistogramStore::scaled_sibling("/data/histograms.root") == "/data/histograms_scaled.root", "root extension");
    check(HistogramStore::scaled_sibling("merged.v2.root") == "merged.v2_scaled.root", "only the extension is replaced");
    check(HistogramStore::scaled_sibling("histograms") == "histograms_scaled", "no extension");
}

void test_stored_class_and_decoration_survive()
{
    const fs::path dir = scratch_dir();
    const std::string path = (dir / "float.root").string();

    {
        TFile f(path.c_str(), "RECREATE");
        TH1F h("4j2b_wjets", "wjets", 3, 0.0, 3.0);
        h.SetDirectory(nullptr);
        h.GetXaxis()->SetTitle("H_{T} [GeV]");
        h.GetYaxis()->SetTitle("Events");
        h.GetXaxis()->SetBinLabel(2, "mid");
        h.SetBinContent(2, 6.0);
        f.WriteTObject(&h, "4j2b_wjets");
        f.Close();
    }

    const std::string copy = (dir / "float_copy.root").string();
    {
        HistogramStore in = HistogramStore::open_read(path);
        const auto records = in.list();
        check(records.size() == 1, "one record");
        check(std::string(records[0].hist().ClassName()) == "TH1F", "record keeps the stored class");

        HistogramStore out = HistogramStore::open_write(copy);
        out.write(records[0]);
        out.commit();
    }

    TFile f(copy.c_str(), "READ");
    auto *h = dynamic_cast<TH1F *>(f.Get("4j2b_wjets"));
    check(h != nullptr, "written back as TH1F");
    check(std::string(h->GetXaxis()->GetTitle()) == "H_{T} [GeV]", "x axis title survives");
    check(std::string(h->GetYaxis()->GetTitle()) == "Events", "y axis title survives");
    check(std::string(h->GetXaxis()->GetBinLabel(2)) == "mid", "bin label survives");
    check(h->GetBinContent(2) == 6.0, "contents survive");
    f.Close();
}

void test_record_without_histogram_cannot_be_written()
{
    const fs::path dir = scratch_dir();
    HistogramStore out = HistogramStore::open_write((dir / "empty.root").string());
    HistogramRecord empty;
    empty.name = "4j1b_ttbar";
    bool threw = false;
    try
    {
        out.write(empty);
    }
    catch (const StoreError &)
    {
        threw = true;
    }
    check(threw, "a record needs a histogram to be written");
}

} // namespace

int main()
{
    TH1::AddDirectory(false);
    test_commit_renames_temp_file();
    test_uncommitted_write_is_discarded();
    test_existing_destination_survives_a_failed_write();
    test_list_and_passthrough();
    test_every_cycle_is_listed();
    test_metadata_under_wrong_type();
    test_open_failures();
    test_wrong_mode_is_rejected();
    test_scaled_sibling();
    test_stored_class_and_decoration_survive();
    test_record_without_histogram_cannot_be_written();
    fs::remove_all(fs::temp_directory_path() / "histpost_test_histogram_store");
    std::cout << "test_histogram_store: ok\n";
    return 0;
}
