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

#include <reportplanner.hpp>
#include <worddiffer.hpp>

#include <algorithm>

namespace {

void add_regions(std::vector<HighlightRegion> &regions,
                 const std::vector<Word> &words,
                 size_t first,
                 size_t last,
                 Side side,
                 const PagePlacement &placement) {
    const auto kind = side == Side::A ? HighlightKind::Removed : HighlightKind::Added;
    for(size_t w = first; w < last; ++w) {
        regions.emplace_back(HighlightRegion{side, map_bbox(words[w].bbox, placement), kind});
    }
}

PageComparisonResult singleton(std::optional<size_t> idx_a, std::optional<size_t> idx_b) {
    PageComparisonResult r;
    r.a_index = idx_a;
    r.b_index = idx_b;
    r.shifted = false;
    return r;
}

} // namespace

PageComparisonResult compare_page_pair(size_t idx_a,
                                       size_t idx_b,
                                       const WordLookup &word_lookup,
                                       const LayoutLookup &layout) {
    PageComparisonResult result;
    result.a_index = idx_a;
    result.b_index = idx_b;
    result.shifted = idx_a != idx_b;

    const auto words_a = word_lookup(Side::A, idx_a);
    const auto words_b = word_lookup(Side::B, idx_b);
    const auto placement_a = layout(Side::A, idx_a);
    const auto placement_b = layout(Side::B, idx_b);
    for(const auto &op : diff_words(words_a, words_b)) {
        switch(op.tag) {
        case DiffTag::Equal:
            break;
        case DiffTag::Replace:
            add_regions(result.regions, words_a, op.i1, op.i2, Side::A, placement_a);
            add_regions(result.regions, words_b, op.j1, op.j2, Side::B, placement_b);
            break;
        case DiffTag::Delete:
            add_regions(result.regions, words_a, op.i1, op.i2, Side::A, placement_a);
            break;
        case DiffTag::Insert:
            add_regions(result.regions, words_b, op.j1, op.j2, Side::B, placement_b);
            break;
        }
    }
    return result;
}

std::vector<PageComparisonResult> plan_report(const AlignmentPlan &alignment,
                                              const WordLookup &word_lookup,
                                              const LayoutLookup &layout) {
    std::vector<PageComparisonResult> results;
    for(const auto &op : alignment) {
        switch(op.tag) {
        case DiffTag::Equal:
        case DiffTag::Replace: {
            const size_t count = std::max(op.a_len(), op.b_len());
            for(size_t k = 0; k < count; ++k) {
                std::optional<size_t> idx_a;
                std::optional<size_t> idx_b;
                if(op.i1 + k < op.i2) {
                    idx_a = op.i1 + k;
                }
                if(op.j1 + k < op.j2) {
                    idx_b = op.j1 + k;
                }
                if(idx_a && idx_b) {
                    results.emplace_back(compare_page_pair(*idx_a, *idx_b, word_lookup, layout));
                } else {
                    results.emplace_back(singleton(idx_a, idx_b));
                }
            }
            break;
        }
        case DiffTag::Delete:
            for(size_t i = op.i1; i < op.i2; ++i) {
                results.emplace_back(singleton(i, std::nullopt));
            }
            break;
        case DiffTag::Insert:
            for(size_t j = op.j1; j < op.j2; ++j) {
                results.emplace_back(singleton(std::nullopt, j));
            }
            break;
        }
    }
    return results;
}

ComparisonSummary summarize(const std::vector<PageComparisonResult> &results) {
    ComparisonSummary s;
    for(const auto &r : results) {
        if(r.is_pair()) {
            ++s.pairs;
            if(r.has_changes()) {
                ++s.changed;
            }
            if(r.shifted) {
                ++s.shifted;
            }
        } else if(r.a_index) {
            ++s.removed;
        } else {
            ++s.added;
        }
    }
    return s;
}
