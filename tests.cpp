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

#include <coordmapper.hpp>
#include <pagealigner.hpp>
#include <reportplanner.hpp>
#include <sequencematcher.hpp>
#include <similarity.hpp>
#include <worddiffer.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
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

bool same_box(const BBox &a, const BBox &b) {
    return approx(a.x0, b.x0) && approx(a.y0, b.y0) && approx(a.x1, b.x1) && approx(a.y1, b.y1);
}

std::vector<PageText> pages(const std::vector<std::string> &contents) {
    std::vector<PageText> result;
    for(size_t i = 0; i < contents.size(); ++i) {
        result.emplace_back(PageText{i, contents[i]});
    }
    return result;
}

std::vector<Word> words(const std::vector<std::string> &texts) {
    std::vector<Word> result;
    double x = 0;
    for(const auto &t : texts) {
        result.emplace_back(Word{t, BBox{x, 10, x + 5.0 * t.size(), 20}});
        x += 5.0 * t.size() + 5;
    }
    return result;
}

std::span<const char> chars(const std::string &s) { return std::span<const char>(s.data(), s.size()); }

const std::string page_p{"The quick brown fox jumps over the lazy dog."};
const std::string page_q{"Pack my box with five dozen liquor jugs, said the old sailor."};
const std::string page_r{"0123456789 0123456789"};

} // namespace

void test_ratio_identical() {
    CHECK(similarity_ratio("", "") == 1.0);
    CHECK(similarity_ratio("abc", "abc") == 1.0);
    CHECK(similarity_ratio(std::vector<std::string>{}, std::vector<std::string>{}) == 1.0);
}

void test_ratio_disjoint() {
    CHECK(similarity_ratio("abc", "xyz") == 0.0);
    CHECK(similarity_ratio("abc", "") == 0.0);
    CHECK(similarity_ratio("", "abc") == 0.0);
}

void test_ratio_value() {
    // Common block "bcd".
    CHECK(approx(similarity_ratio("abcd", "bcde"), 0.75));
    CHECK(approx(similarity_ratio("bcde", "abcd"), 0.75));
    const std::vector<std::string> a{"one", "two", "three"};
    const std::vector<std::string> b{"one", "three"};
    CHECK(approx(similarity_ratio(a, b), 0.8));
}

void test_ratio_unicode() {
    // Scored per character, not per UTF-8 byte.
    CHECK(similarity_ratio("é", "è") == 0.0);
    CHECK(approx(similarity_ratio("привет", "пока"), 0.2));
    CHECK(approx(similarity_ratio("αβγδ", "αβεζ"), 0.5));
    CHECK(approx(similarity_ratio("naïve café", "naive cafe"), 0.8));
    bool thrown = false;
    try {
        similarity_ratio("bad \xff byte", "bad byte");
    } catch(const std::runtime_error &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_ratio_bounds() {
    const std::vector<std::string> samples{"", "a", "ab", "hello world", "world hello", "aaaa", "abab"};
    for(const auto &x : samples) {
        for(const auto &y : samples) {
            const double r = similarity_ratio(x, y);
            CHECK(r >= 0.0 && r <= 1.0);
        }
    }
    CHECK(approx(similarity_ratio("hello world", "world hello"),
                 similarity_ratio("world hello", "hello world")));
    // The leftmost tie-break makes the ratio order dependent in general.
    CHECK(approx(similarity_ratio("ba", "abca"), 4.0 / 6.0));
    CHECK(approx(similarity_ratio("abca", "ba"), 2.0 / 6.0));
}

void test_longest_match_leftmost() {
    const std::string a{"abxy"};
    const std::string b{"xyab"};
    SequenceMatcher<char> m(chars(a), chars(b));
    const auto block = m.find_longest_match(0, a.size(), 0, b.size());
    CHECK(block == (MatchBlock{0, 2, 2}));
}

void test_matching_blocks() {
    const std::string a{"abxcd"};
    const std::string b{"abcd"};
    SequenceMatcher<char> m(chars(a), chars(b));
    const auto &blocks = m.matching_blocks();
    CHECK(blocks.size() == 3);
    CHECK(blocks[0] == (MatchBlock{0, 0, 2}));
    CHECK(blocks[1] == (MatchBlock{3, 2, 2}));
    CHECK(blocks[2] == (MatchBlock{5, 4, 0}));
    const auto ops = m.opcodes();
    CHECK(ops.size() == 3);
    CHECK(ops[0] == (EditOp{DiffTag::Equal, 0, 2, 0, 2}));
    CHECK(ops[1] == (EditOp{DiffTag::Delete, 2, 3, 2, 2}));
    CHECK(ops[2] == (EditOp{DiffTag::Equal, 3, 5, 2, 4}));
}

void test_autojunk() {
    const std::string b(250, 'a');
    const std::string a = "b" + b;
    SequenceMatcher<char> plain(chars(a), chars(b));
    CHECK(plain.matched_count() == 250);
    // Every 'a' is popular, so nothing can seed a match.
    SequenceMatcher<char> junked(chars(a), chars(b), true);
    CHECK(junked.matched_count() == 0);
    // A match at the very start still grows over popular elements.
    SequenceMatcher<char> same(chars(b), chars(b), true);
    CHECK(same.ratio() == 1.0);
}

void test_matcher() {
    test_ratio_identical();
    test_ratio_disjoint();
    test_ratio_value();
    test_ratio_unicode();
    test_ratio_bounds();
    test_longest_match_leftmost();
    test_matching_blocks();
    test_autojunk();
}

void test_align_empty() {
    CHECK(align_pages({}, {}).empty());

    const auto inserted = align_pages({}, pages({"a", "b", "c"}));
    CHECK(inserted.size() == 1);
    CHECK(inserted[0] == (AlignmentOp{DiffTag::Insert, 0, 0, 0, 3}));

    const auto deleted = align_pages(pages({"a", "b"}), {});
    CHECK(deleted.size() == 1);
    CHECK(deleted[0] == (AlignmentOp{DiffTag::Delete, 0, 2, 0, 0}));
}

void test_align_identity() {
    const auto doc = pages({page_p, page_q, page_r, page_q, ""});
    const auto plan = align_pages(doc, doc);
    CHECK(plan.size() == 1);
    CHECK(plan[0] == (AlignmentOp{DiffTag::Equal, 0, 5, 0, 5}));
}

void test_align_shift() {
    const auto plan = align_pages(pages({"alpha content", "beta content"}),
                                  pages({"alpha content", "new page", "beta content"}));
    CHECK(plan.size() == 3);
    CHECK(plan[0] == (AlignmentOp{DiffTag::Equal, 0, 1, 0, 1}));
    CHECK(plan[1] == (AlignmentOp{DiffTag::Insert, 1, 1, 1, 2}));
    CHECK(plan[2] == (AlignmentOp{DiffTag::Equal, 1, 2, 2, 3}));
}

void test_align_delete() {
    const auto plan = align_pages(pages({"x", "y", "z"}), pages({"x", "z"}));
    CHECK(plan.size() == 3);
    CHECK(plan[0] == (AlignmentOp{DiffTag::Equal, 0, 1, 0, 1}));
    CHECK(plan[1] == (AlignmentOp{DiffTag::Delete, 1, 2, 1, 1}));
    CHECK(plan[2] == (AlignmentOp{DiffTag::Equal, 2, 3, 1, 2}));
}

void test_align_replace() {
    const auto plan = align_pages(pages({"aaaa"}), pages({"zzzz"}));
    CHECK(plan.size() == 1);
    CHECK(plan[0] == (AlignmentOp{DiffTag::Replace, 0, 1, 0, 1}));
}

void test_align_non_latin() {
    // Shared UTF-8 lead bytes must not lift the score over the threshold.
    const auto plan = align_pages(pages({"αβγδ"}), pages({"αβεζ"}));
    CHECK(plan.size() == 1);
    CHECK(plan[0] == (AlignmentOp{DiffTag::Replace, 0, 1, 0, 1}));
}

void test_align_threshold() {
    // Ratio is exactly 0.5.
    const auto a = pages({"abcdef"});
    const auto b = pages({"abcxyz"});
    CHECK(align_pages(a, b)[0].tag == DiffTag::Replace);
    AlignmentParameters loose;
    loose.similarity_threshold = 0.4;
    CHECK(align_pages(a, b, loose)[0].tag == DiffTag::Equal);
}

void test_align_tie_prefers_delete() {
    const auto plan = align_pages(pages({page_p, page_q}), pages({page_q, page_p}));
    CHECK(plan.size() == 3);
    CHECK(plan[0] == (AlignmentOp{DiffTag::Delete, 0, 1, 0, 0}));
    CHECK(plan[1] == (AlignmentOp{DiffTag::Equal, 1, 2, 0, 1}));
    CHECK(plan[2] == (AlignmentOp{DiffTag::Insert, 2, 2, 1, 2}));
}

void test_align_lookahead() {
    const auto a = pages({page_p});
    const auto b = pages({"!!!!!!!!", "########", "@@@@@@@@", page_p});
    const auto narrow = align_pages(a, b);
    CHECK(narrow.size() == 2);
    CHECK(narrow[0] == (AlignmentOp{DiffTag::Replace, 0, 1, 0, 1}));
    CHECK(narrow[1] == (AlignmentOp{DiffTag::Insert, 1, 1, 1, 4}));

    AlignmentParameters wide;
    wide.lookahead_window = 4;
    const auto plan = align_pages(a, b, wide);
    CHECK(plan.size() == 2);
    CHECK(plan[0] == (AlignmentOp{DiffTag::Insert, 0, 0, 0, 3}));
    CHECK(plan[1] == (AlignmentOp{DiffTag::Equal, 0, 1, 3, 4}));
}

void test_align_coverage() {
    const std::vector<std::string> pool{page_p, page_q, page_r, "", "short", page_p + page_q};
    std::mt19937 gen(1234);
    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
    std::uniform_int_distribution<size_t> count(0, 9);
    for(int round = 0; round < 200; ++round) {
        std::vector<std::string> a, b;
        const size_t len_a = count(gen);
        const size_t len_b = count(gen);
        for(size_t i = 0; i < len_a; ++i) {
            a.push_back(pool[pick(gen)]);
        }
        for(size_t i = 0; i < len_b; ++i) {
            b.push_back(pool[pick(gen)]);
        }
        const auto plan = align_pages(pages(a), pages(b));
        CHECK(ops_cover(plan, len_a, len_b));
    }
}

void test_alignment() {
    test_align_empty();
    test_align_identity();
    test_align_shift();
    test_align_delete();
    test_align_replace();
    test_align_non_latin();
    test_align_threshold();
    test_align_tie_prefers_delete();
    test_align_lookahead();
    test_align_coverage();
}

void test_word_diff_identity() {
    const auto w = words({"the", "cat", "sat"});
    const auto ops = diff_words(w, w);
    CHECK(ops.size() == 1);
    CHECK(ops[0] == (WordDiffOp{DiffTag::Equal, 0, 3, 0, 3}));
}

void test_word_diff_insert() {
    const auto ops = diff_words(words({"Hello"}), words({"Hello", "World"}));
    CHECK(ops.size() == 2);
    CHECK(ops[0] == (WordDiffOp{DiffTag::Equal, 0, 1, 0, 1}));
    CHECK(ops[1] == (WordDiffOp{DiffTag::Insert, 1, 1, 1, 2}));
}

void test_word_diff_replace() {
    const auto a = words({"a", "quick", "brown", "fox"});
    const auto b = words({"a", "slow", "red", "fox", "today"});
    const auto ops = diff_words(a, b);
    CHECK(ops.size() == 4);
    CHECK(ops[0] == (WordDiffOp{DiffTag::Equal, 0, 1, 0, 1}));
    CHECK(ops[1] == (WordDiffOp{DiffTag::Replace, 1, 3, 1, 3}));
    CHECK(ops[2] == (WordDiffOp{DiffTag::Equal, 3, 4, 3, 4}));
    CHECK(ops[3] == (WordDiffOp{DiffTag::Insert, 4, 4, 4, 5}));
    CHECK(ops_cover(ops, a.size(), b.size()));
}

void test_word_diff_ignores_boxes() {
    auto a = words({"same", "text"});
    auto b = a;
    b[1].bbox = BBox{100, 100, 200, 200};
    const auto ops = diff_words(a, b);
    CHECK(ops.size() == 1);
    CHECK(ops[0].tag == DiffTag::Equal);
}

void test_word_diff_empty() {
    CHECK(diff_words({}, {}).empty());
    const auto ops = diff_words({}, words({"new"}));
    CHECK(ops.size() == 1);
    CHECK(ops[0] == (WordDiffOp{DiffTag::Insert, 0, 0, 0, 1}));
    const auto gone = diff_words(words({"old", "words"}), {});
    CHECK(gone.size() == 1);
    CHECK(gone[0] == (WordDiffOp{DiffTag::Delete, 0, 2, 0, 0}));
}

void test_word_diff() {
    test_word_diff_identity();
    test_word_diff_insert();
    test_word_diff_replace();
    test_word_diff_ignores_boxes();
    test_word_diff_empty();
}

void test_map_bbox() {
    const BBox b{10, 20, 30, 40};
    CHECK(same_box(map_bbox(b, 2.0, 3.0, 5.0, 7.0), BBox{25, 67, 65, 127}));
    // Malformed boxes are not normalized.
    const BBox flipped{30, 40, 10, 20};
    CHECK(same_box(map_bbox(flipped, 1.0, 1.0, 0.0, 0.0), flipped));
    CHECK(same_box(map_bbox(flipped, 2.0, 2.0, 1.0, 1.0), BBox{61, 81, 21, 41}));
}

void test_fit_placement() {
    const auto p = fit_placement(PageSize{100, 200}, PageSize{150, 100}, 10, 20);
    CHECK(approx(p.scale_x, 1.5));
    CHECK(approx(p.scale_y, 0.5));
    CHECK(same_box(map_bbox(BBox{0, 0, 100, 200}, p), BBox{10, 20, 160, 120}));
}

void test_compose_placements() {
    const PagePlacement first{2.0, 0.5, 3.0, -4.0};
    const PagePlacement second{1.5, 4.0, 10.0, 1.0};
    const auto both = compose_placements(first, second);
    CHECK(approx(both.scale_x, 3.0));
    CHECK(approx(both.scale_y, 2.0));
    CHECK(approx(both.offset_x, 3.0 * 1.5 + 10.0));
    CHECK(approx(both.offset_y, -4.0 * 4.0 + 1.0));
    const BBox b{1, 2, 3, 4};
    CHECK(same_box(map_bbox(b, both), map_bbox(map_bbox(b, first), second)));
}

void test_coordinates() {
    test_map_bbox();
    test_fit_placement();
    test_compose_placements();
}

void test_plan_word_highlight() {
    const BBox bbox1{10, 10, 40, 20};
    const BBox bbox2{45, 10, 80, 20};
    const std::vector<Word> words_a{{"Hello", bbox1}};
    const std::vector<Word> words_b{{"Hello", bbox1}, {"World", bbox2}};
    const PagePlacement place_a{1.0, 1.0, 20.0, 60.0};
    const PagePlacement place_b{2.0, 2.0, 650.0, 60.0};
    WordLookup lookup = [&](Side side, size_t) { return side == Side::A ? words_a : words_b; };
    LayoutLookup layout = [&](Side side, size_t) { return side == Side::A ? place_a : place_b; };

    const AlignmentPlan plan{AlignmentOp{DiffTag::Equal, 0, 1, 0, 1}};
    const auto results = plan_report(plan, lookup, layout);
    CHECK(results.size() == 1);
    const auto &r = results[0];
    CHECK(r.a_index == 0u);
    CHECK(r.b_index == 0u);
    CHECK(!r.shifted);
    CHECK(r.regions.size() == 1);
    CHECK(r.regions[0].side == Side::B);
    CHECK(r.regions[0].kind == HighlightKind::Added);
    CHECK(same_box(r.regions[0].bbox, map_bbox(bbox2, place_b)));
}

void test_plan_replaced_words() {
    const std::vector<Word> words_a = words({"keep", "old"});
    const std::vector<Word> words_b = words({"keep", "new", "words"});
    WordLookup lookup = [&](Side side, size_t) { return side == Side::A ? words_a : words_b; };
    LayoutLookup layout = [](Side, size_t) { return PagePlacement{}; };
    const auto r = compare_page_pair(3, 3, lookup, layout);
    CHECK(!r.shifted);
    CHECK(r.regions.size() == 3);
    CHECK(r.regions[0].side == Side::A);
    CHECK(r.regions[0].kind == HighlightKind::Removed);
    CHECK(same_box(r.regions[0].bbox, words_a[1].bbox));
    CHECK(r.regions[1].side == Side::B);
    CHECK(r.regions[2].side == Side::B);
    CHECK(same_box(r.regions[2].bbox, words_b[2].bbox));
}

void test_plan_shift() {
    const auto text_a = pages({"alpha content", "beta content"});
    const auto text_b = pages({"alpha content", "new page", "beta content"});
    const auto plan = align_pages(text_a, text_b);
    WordLookup lookup = [&](Side side, size_t page) {
        const auto &text = side == Side::A ? text_a : text_b;
        const auto content = text[page].content;
        return words({content.substr(0, content.find(' ')), content.substr(content.find(' ') + 1)});
    };
    LayoutLookup layout = [](Side, size_t) { return PagePlacement{}; };
    const auto results = plan_report(plan, lookup, layout);
    CHECK(results.size() == 3);

    CHECK(results[0].a_index == 0u && results[0].b_index == 0u);
    CHECK(!results[0].shifted);
    CHECK(results[0].regions.empty());

    CHECK(!results[1].a_index);
    CHECK(results[1].b_index == 1u);
    CHECK(!results[1].shifted);
    CHECK(results[1].regions.empty());

    CHECK(results[2].a_index == 1u && results[2].b_index == 2u);
    CHECK(results[2].shifted);
    CHECK(results[2].regions.empty());
}

void test_plan_singletons() {
    int lookups = 0;
    WordLookup lookup = [&](Side, size_t) {
        ++lookups;
        return std::vector<Word>{};
    };
    LayoutLookup layout = [](Side, size_t) { return PagePlacement{}; };
    const AlignmentPlan plan{AlignmentOp{DiffTag::Delete, 0, 2, 0, 0},
                             AlignmentOp{DiffTag::Replace, 2, 4, 0, 1},
                             AlignmentOp{DiffTag::Insert, 4, 4, 1, 3}};
    const auto results = plan_report(plan, lookup, layout);
    CHECK(results.size() == 6);
    CHECK(results[0].a_index == 0u && !results[0].b_index);
    CHECK(results[1].a_index == 1u && !results[1].b_index);
    CHECK(results[2].a_index == 2u && results[2].b_index == 0u);
    CHECK(results[2].shifted);
    CHECK(results[3].a_index == 3u && !results[3].b_index);
    CHECK(!results[3].shifted);
    CHECK(!results[4].a_index && results[4].b_index == 1u);
    CHECK(!results[5].a_index && results[5].b_index == 2u);
    // Only the one real pair looks words up.
    CHECK(lookups == 2);

    const auto s = summarize(results);
    CHECK(s.pairs == 1);
    CHECK(s.changed == 0);
    CHECK(s.shifted == 1);
    CHECK(s.removed == 3);
    CHECK(s.added == 2);
}

void test_planner() {
    test_plan_word_highlight();
    test_plan_replaced_words();
    test_plan_shift();
    test_plan_singletons();
}

int main(int, char **) {
    printf("Running matcher tests.\n");
    test_matcher();
    printf("Running alignment tests.\n");
    test_alignment();
    printf("Running word diff tests.\n");
    test_word_diff();
    printf("Running coordinate tests.\n");
    test_coordinates();
    printf("Running report planner tests.\n");
    test_planner();
    return 0;
}
