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

#pragma once

#include <diffcommon.hpp>
#include <coordmapper.hpp>

#include <functional>
#include <vector>

typedef std::function<std::vector<Word>(Side side, size_t page)> WordLookup;
typedef std::function<PagePlacement(Side side, size_t page)> LayoutLookup;

/*
 * Turns an alignment plan into one result per report page. Page pairs get
 * their changed words as highlight regions in report coordinates, pages
 * present on only one side get an empty result with the other index unset.
 *
 * Results are in plan order and ascending page order within each op.
 * Report pagination depends on this.
 */
std::vector<PageComparisonResult> plan_report(const AlignmentPlan &alignment,
                                              const WordLookup &word_lookup,
                                              const LayoutLookup &layout);

PageComparisonResult compare_page_pair(size_t idx_a,
                                       size_t idx_b,
                                       const WordLookup &word_lookup,
                                       const LayoutLookup &layout);

struct ComparisonSummary {
    size_t pairs = 0;
    size_t changed = 0;
    size_t shifted = 0;
    size_t added = 0;   // Pages only in B.
    size_t removed = 0; // Pages only in A.
};

ComparisonSummary summarize(const std::vector<PageComparisonResult> &results);
