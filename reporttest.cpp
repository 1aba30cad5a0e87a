/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <config.hpp>
#include <reportlayout.hpp>
#include <textdiff.hpp>
#include <utils.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

bool approx(double a, double b) { return std::fabs(a - b) < 1e-9; }

bool config_rejected(const char *text) {
    try {
        parse_config(nlohmann::json::parse(text));
    } catch(const std::runtime_error &) {
        return true;
    }
    return false;
}

std::vector<PageText> pages(const std::vector<std::string> &contents) {
    std::vector<PageText> result;
    for(size_t i = 0; i < contents.size(); ++i) {
        result.emplace_back(PageText{i, contents[i]});
    }
    return result;
}

} // namespace

void test_vector_layout() {
    ReportLayout layout(LayoutParameters{}, {{600, 800}, {500, 700}}, {{400, 300}});
    CHECK(!layout.is_raster());
    CHECK(approx(layout.column_x(Side::A), 20));
    CHECK(approx(layout.column_x(Side::B), 630));
    CHECK(approx(layout.column_width(Side::A), 600));
    CHECK(approx(layout.column_width(Side::B), 400));
    CHECK(approx(layout.label_y(), 20));
    CHECK(approx(layout.content_y(), 60));

    const auto p = layout.placement(Side::B, 0);
    CHECK(approx(p.scale_x, 1.0) && approx(p.scale_y, 1.0));
    CHECK(approx(p.offset_x, 630) && approx(p.offset_y, 60));

    PageComparisonResult pair;
    pair.a_index = 0;
    pair.b_index = 0;
    const auto size = layout.report_page_size(pair);
    CHECK(approx(size.w, 1050));
    CHECK(approx(size.h, 880));

    PageComparisonResult added;
    added.b_index = 0;
    CHECK(approx(layout.report_page_size(added).h, 380));
}

void test_raster_layout() {
    LayoutParameters par;
    par.dpi = 100;
    ReportLayout layout(par, {{595.3, 841.9}}, {{595.3, 841.9}});
    CHECK(layout.is_raster());
    const auto target = layout.target_size(Side::A, 0);
    CHECK(approx(target.w, 826));
    CHECK(approx(target.h, 1169));

    // Rounding to whole pixels makes the axes scale differently.
    const auto p = layout.placement(Side::A, 0);
    CHECK(approx(p.scale_x, 826 / 595.3));
    CHECK(approx(p.scale_y, 1169 / 841.9));
    CHECK(!approx(p.scale_x, p.scale_y));
    CHECK(approx(p.offset_x, 20 * 100 / 72.0));
    CHECK(approx(p.offset_y, 60 * 100 / 72.0));
    CHECK(approx(layout.column_x(Side::B), (20 + 595.3 + 10) * 100 / 72.0));
}

void test_empty_side_layout() {
    ReportLayout layout(LayoutParameters{}, {{612, 792}}, {});
    CHECK(approx(layout.column_width(Side::B), 612));
    PageComparisonResult missing;
    missing.a_index = 0;
    const auto size = layout.report_page_size(missing);
    CHECK(approx(size.w, 40 + 612 + 10 + 612));
    CHECK(approx(size.h, 80 + 792));
}

void test_layout() {
    test_vector_layout();
    test_raster_layout();
    test_empty_side_layout();
}

void test_config_defaults() {
    const auto config = parse_config(nlohmann::json::parse("{}"));
    CHECK(approx(config.alignment.similarity_threshold, 0.6));
    CHECK(config.alignment.lookahead_window == 3);
    CHECK(!config.alignment.autojunk);
    CHECK(approx(config.layout.margin, 20));
    CHECK(approx(config.layout.gap, 10));
    CHECK(approx(config.layout.label_height, 40));
    CHECK(approx(config.layout.dpi, 0));
    CHECK(config.report.label_font == "Sans");
    CHECK(!config.report.skip_identical);
}

void test_config_values() {
    const auto config = parse_config(nlohmann::json::parse(R"({
        "alignment": {"similarity_threshold": 0.75, "lookahead_window": 5, "autojunk": true},
        "layout": {"margin": 12, "dpi": 150},
        "report": {"label_font": "Serif", "label_size": 9, "skip_identical": true}
    })"));
    CHECK(approx(config.alignment.similarity_threshold, 0.75));
    CHECK(config.alignment.lookahead_window == 5);
    CHECK(config.alignment.autojunk);
    CHECK(approx(config.layout.margin, 12));
    CHECK(approx(config.layout.gap, 10));
    CHECK(approx(config.layout.dpi, 150));
    CHECK(config.report.label_font == "Serif");
    CHECK(approx(config.report.label_size, 9));
    CHECK(config.report.skip_identical);
}

void test_config_errors() {
    CHECK(config_rejected("[]"));
    CHECK(config_rejected(R"({"alignment": 3})"));
    CHECK(config_rejected(R"({"alignment": {"similarity_threshold": "high"}})"));
    CHECK(config_rejected(R"({"alignment": {"similarity_threshold": 1.5}})"));
    CHECK(config_rejected(R"({"alignment": {"lookahead_window": 2.5}})"));
    CHECK(config_rejected(R"({"alignment": {"lookahead_window": 0}})"));
    CHECK(config_rejected(R"({"layout": {"margin": -1}})"));
    CHECK(config_rejected(R"({"layout": {"dpi": 5000}})"));
    CHECK(config_rejected(R"({"report": {"skip_identical": "yes"}})"));
    CHECK(config_rejected(R"({"alignment": {"lookahead_window": 4294967299}})"));
    CHECK(config_rejected(R"({"alignment": {"lookahead_window": -3000000000}})"));
    CHECK(!config_rejected(R"({"unknown": 1})"));
}

bool overrides_rejected(const ConfigOverrides &overrides) {
    CompareConfig config;
    try {
        apply_overrides(config, overrides);
    } catch(const std::runtime_error &) {
        return true;
    }
    return false;
}

void test_config_overrides() {
    CompareConfig config;
    ConfigOverrides overrides;
    overrides.threshold = 0.8;
    overrides.lookahead = 5;
    overrides.dpi = 72;
    overrides.skip_identical = true;
    apply_overrides(config, overrides);
    CHECK(approx(config.alignment.similarity_threshold, 0.8));
    CHECK(config.alignment.lookahead_window == 5);
    CHECK(approx(config.layout.dpi, 72));
    CHECK(config.report.skip_identical);

    CompareConfig untouched;
    apply_overrides(untouched, ConfigOverrides{});
    CHECK(approx(untouched.alignment.similarity_threshold, 0.6));
    CHECK(untouched.alignment.lookahead_window == 3);

    ConfigOverrides negative_threshold;
    negative_threshold.threshold = -0.5;
    CHECK(overrides_rejected(negative_threshold));
    ConfigOverrides zero_lookahead;
    zero_lookahead.lookahead = 0;
    CHECK(overrides_rejected(zero_lookahead));
    ConfigOverrides negative_lookahead;
    negative_lookahead.lookahead = -2;
    CHECK(overrides_rejected(negative_lookahead));
    ConfigOverrides negative_dpi;
    negative_dpi.dpi = -1;
    CHECK(overrides_rejected(negative_dpi));
}

void test_config() {
    test_config_defaults();
    test_config_values();
    test_config_errors();
    test_config_overrides();
}

void test_words_from_layout() {
    // é and ö are two bytes each but one box each.
    const std::string text{"héllo wörld\n"};
    std::vector<BBox> boxes;
    for(int i = 0; i < 12; ++i) {
        boxes.emplace_back(BBox{i * 10.0, 0.0, i * 10.0 + 8, 12.0});
    }
    const auto words = words_from_layout(text, boxes);
    CHECK(words.size() == 2);
    CHECK(words[0].text == "héllo");
    CHECK(words[0].bbox == (BBox{0, 0, 48, 12}));
    CHECK(words[1].text == "wörld");
    CHECK(words[1].bbox == (BBox{60, 0, 108, 12}));
}

void test_words_whitespace() {
    const auto words = words_from_layout("  one\t\ttwo \n three  ", {});
    CHECK(words.size() == 3);
    CHECK(words[0].text == "one");
    CHECK(words[1].text == "two");
    CHECK(words[2].text == "three");
    CHECK(words_from_layout("", {}).empty());
    CHECK(words_from_layout(" \n ", {}).empty());
}

void test_words_invalid_utf8() {
    bool thrown = false;
    try {
        words_from_layout("bad \xff byte", {});
    } catch(const std::runtime_error &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_png_names() {
    CHECK(numbered_png_name("report.png", 1) == "report-001.png");
    CHECK(numbered_png_name("out/diff", 12) == "out/diff-012.png");
}

void test_utils() {
    test_words_from_layout();
    test_words_whitespace();
    test_words_invalid_utf8();
    test_png_names();
}

void test_split_lines() {
    const auto lines = split_text_lines("one\ntwo\r\n\nthree\rfour\n");
    CHECK(lines.size() == 5);
    CHECK(lines[0] == "one");
    CHECK(lines[1] == "two");
    CHECK(lines[2].empty());
    CHECK(lines[3] == "three");
    CHECK(lines[4] == "four");
    CHECK(split_text_lines("").empty());
}

void test_unified_range() {
    CHECK(format_unified_range(0, 3) == "1,3");
    CHECK(format_unified_range(4, 5) == "5");
    CHECK(format_unified_range(4, 4) == "4,0");
}

void test_unified_identical() {
    const auto doc = pages({"same\ntext", "second page"});
    CHECK(unified_text_diff(doc, doc).empty());
    CHECK(unified_text_diff({}, {}).empty());
}

void test_unified_change() {
    const auto diff = unified_text_diff(pages({"line1\nline2", "line3"}),
                                        pages({"line1\nlineX", "line3"}));
    const std::vector<std::string> expected{
        "--- PDF A", "+++ PDF B", "@@ -1,3 +1,3 @@", " line1", "-line2", "+lineX", " line3"};
    CHECK(diff == expected);
}

void test_unified_hunks() {
    std::vector<std::string> a;
    for(int i = 1; i <= 20; ++i) {
        a.push_back("l" + std::to_string(i));
    }
    auto b = a;
    b[1] = "changed";
    b.erase(b.begin() + 17);
    std::string text_a, text_b;
    for(const auto &l : a) {
        text_a += l + "\n";
    }
    for(const auto &l : b) {
        text_b += l + "\n";
    }
    const auto diff = unified_text_diff(pages({text_a}), pages({text_b}));
    const std::vector<std::string> expected{"--- PDF A",
                                            "+++ PDF B",
                                            "@@ -1,5 +1,5 @@",
                                            " l1",
                                            "-l2",
                                            "+changed",
                                            " l3",
                                            " l4",
                                            " l5",
                                            "@@ -15,6 +15,5 @@",
                                            " l15",
                                            " l16",
                                            " l17",
                                            "-l18",
                                            " l19",
                                            " l20"};
    CHECK(diff == expected);
}

void test_textdiff() {
    test_split_lines();
    test_unified_range();
    test_unified_identical();
    test_unified_change();
    test_unified_hunks();
}

int main(int, char **) {
    printf("Running layout tests.\n");
    test_layout();
    printf("Running config tests.\n");
    test_config();
    printf("Running utility tests.\n");
    test_utils();
    printf("Running text diff tests.\n");
    test_textdiff();
    return 0;
}
