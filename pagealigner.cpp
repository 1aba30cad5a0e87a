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

#include <pagealigner.hpp>
#include <similarity.hpp>

#include <algorithm>
#include <cassert>

namespace {

struct SkipCandidate {
    size_t skip = 0;
    double similarity = 0.0;
};

void push_op(AlignmentPlan &plan, const AlignmentOp &op) {
    if(!plan.empty()) {
        auto &prev = plan.back();
        if(prev.tag == op.tag && prev.i2 == op.i1 && prev.j2 == op.j1) {
            prev.i2 = op.i2;
            prev.j2 = op.j2;
            return;
        }
    }
    plan.push_back(op);
}

} // namespace

AlignmentPlan align_pages(const std::vector<PageText> &text_a,
                          const std::vector<PageText> &text_b,
                          const AlignmentParameters &params) {
    const size_t len_a = text_a.size();
    const size_t len_b = text_b.size();
    const size_t window = size_t(std::max(params.lookahead_window, 1));
    const double threshold = params.similarity_threshold;
    auto score = [&](size_t i, size_t j) {
        return similarity_ratio(text_a[i].content, text_b[j].content, params.autojunk);
    };

    AlignmentPlan plan;
    size_t i = 0;
    size_t j = 0;
    while(i < len_a || j < len_b) {
        if(i >= len_a) {
            push_op(plan, AlignmentOp{DiffTag::Insert, i, i, j, len_b});
            break;
        }
        if(j >= len_b) {
            push_op(plan, AlignmentOp{DiffTag::Delete, i, len_a, j, j});
            break;
        }
        const double current = score(i, j);

        SkipCandidate insert;
        const size_t max_skip_b = std::min(window, len_b - j);
        for(size_t k = 1; k < max_skip_b; ++k) {
            const double s = score(i, j + k);
            if(s > current && s > threshold && s > insert.similarity) {
                insert = SkipCandidate{k, s};
            }
        }
        SkipCandidate del;
        const size_t max_skip_a = std::min(window, len_a - i);
        for(size_t k = 1; k < max_skip_a; ++k) {
            const double s = score(i + k, j);
            if(s > current && s > threshold && s > del.similarity) {
                del = SkipCandidate{k, s};
            }
        }

        if(insert.skip > 0 && (del.skip == 0 || insert.similarity > del.similarity)) {
            push_op(plan, AlignmentOp{DiffTag::Insert, i, i, j, j + insert.skip});
            j += insert.skip;
        } else if(del.skip > 0) {
            push_op(plan, AlignmentOp{DiffTag::Delete, i, i + del.skip, j, j});
            i += del.skip;
        } else {
            const auto tag = current > threshold ? DiffTag::Equal : DiffTag::Replace;
            push_op(plan, AlignmentOp{tag, i, i + 1, j, j + 1});
            ++i;
            ++j;
        }
    }
    assert(ops_cover(plan, len_a, len_b));
    return plan;
}
