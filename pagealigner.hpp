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

#include <vector>

struct AlignmentParameters {
    // Pages scoring above this are the same page, possibly edited.
    double similarity_threshold = 0.6;
    // Probes skip at most lookahead_window - 1 pages.
    int lookahead_window = 3;
    // Plain Ratcliff-Obershelp by default. Turning this on ignores characters
    // that are very common on long pages, which changes their scores.
    bool autojunk = false;
};

/*
 * Greedy single pass page aligner. At each step the current page pair is
 * scored and compared against pairs where a few pages of either document
 * have been skipped. A skip is only taken if it scores better than both the
 * current pair and the similarity threshold.
 *
 * The returned plan covers every page of both documents exactly once, in
 * order. Adjacent operations with the same tag are merged.
 */
AlignmentPlan align_pages(const std::vector<PageText> &text_a,
                          const std::vector<PageText> &text_b,
                          const AlignmentParameters &params = AlignmentParameters{});
