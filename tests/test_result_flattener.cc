#include "HistogramRecord.hh"
#include "ResultFlattener.hh"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace
{

void check(bool cond, const std::string &msg)
{
    if (!cond)
    {
        std::cerr << "FAIL: " << msg << '\n';
        std::exit(1);
    }
}

using namespace histpost;

HistogramRecord booked(const std::string &name, double value)
{
    HistogramRecord record = make_uniform_record(name, 1, 0.0, 1.0);
    record.set_bin(0, value, 0.0);
    return record;
}

void test_single_histogram()
{
    AnalysisResult result{SingleHistogram{booked("4j1b_ttbar_ME_var", 3.0)}, "4j1b", "ttbar", "ME_var"};
    const auto out = ResultFlattener::flatten({result});
    check(out.size() == 1, "one record");
    check(out[0].name == "4j1b_ttbar_ME_var", "name kept");
    check(out[0].region == "4j1b" && out[0].process == "ttbar" && out[0].variation == "ME_var", "identity");
    check(out[0].bins()[0].value == 3.0, "contents kept");
}

void test_variation_map()
{
    VariationMap map;
    map.histograms.emplace_back("nominal", booked("4j2b_ttbar_nominal", 10.0));
    map.histograms.emplace_back("jet_pt:pt_scale_up", booked("4j2b_ttbar_nominal", 12.0));
    map.histograms.emplace_back("weights:btag_var_0_down", booked("4j2b_ttbar_nominal", 9.0));

    const auto out = ResultFlattener::flatten({AnalysisResult{map, "4j2b", "ttbar", "nominal"}});
    check(out.size() == 3, "one record per key");
    check(out[0].name == "4j2b_ttbar_nominal" && out[0].variation == "nominal", "nominal key");
    check(out[1].name == "4j2b_ttbar_pt_scale_up" && out[1].variation == "pt_scale_up",
          "variation after the last colon replaces nominal");
    check(out[2].name == "4j2b_ttbar_btag_var_0_down", "weight variation");
    check(out[1].bins()[0].value == 12.0, "contents follow the key");
    check(out[2].region == "4j2b" && out[2].process == "ttbar", "identity from the result");
}

void test_mixed_results_keep_order()
{
    VariationMap map;
    map.histograms.emplace_back("a:x", booked("4j1b_wjets_nominal", 1.0));
    const std::vector<AnalysisResult> results = {
        AnalysisResult{SingleHistogram{booked("4j1b_ttbar", 1.0)}, "4j1b", "ttbar", "nominal"},
        AnalysisResult{map, "4j1b", "wjets", "nominal"},
        AnalysisResult{SingleHistogram{booked("4j2b_ttbar", 1.0)}, "4j2b", "ttbar", "nominal"}};

    const auto out = ResultFlattener::flatten(results);
    check(out.size() == 3, "three records");
    check(out[0].name == "4j1b_ttbar" && out[1].name == "4j1b_wjets_x" && out[2].name == "4j2b_ttbar",
          "results flattened in order");
}

void test_variation_from_key()
{
    check(ResultFlattener::variation_from_key("jet_pt:pt_res_up") == "pt_res_up", "after colon");
    check(ResultFlattener::variation_from_key("a:b:c") == "c", "last colon wins");
    check(ResultFlattener::variation_from_key("nominal") == "nominal", "no colon");
    check(ResultFlattener::variation_from_key("trailing:").empty(), "empty tail");
}

} // namespace

int main()
{
    test_single_histogram();
    test_variation_map();
    test_mixed_results_keep_order();
    test_variation_from_key();
    std::cout << "test_result_flattener: ok\n";
    return 0;
}
