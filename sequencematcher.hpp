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

#include <algorithm>
#include <span>
#include <tuple>
#include <unordered_map>
#include <vector>

struct MatchBlock {
    size_t a;
    size_t b;
    size_t size;

    bool operator==(const MatchBlock &o) const noexcept = default;
};

/*
 * Ratcliff-Obershelp matcher. Finds the longest common contiguous block,
 * then recurses on the pieces to the left and right of it. Ties go to the
 * block that starts first in a, then first in b.
 *
 * The sequences are not copied, so they must outlive the matcher.
 */
template<typename T> class SequenceMatcher {
public:
    SequenceMatcher(std::span<const T> a_, std::span<const T> b_, bool autojunk = false)
        : a{a_}, b{b_} {
        index_b(autojunk);
        compute_blocks();
    }

    MatchBlock find_longest_match(size_t alo, size_t ahi, size_t blo, size_t bhi) const {
        size_t besti = alo;
        size_t bestj = blo;
        size_t bestsize = 0;
        // Length of the match ending at a[i-1], b[j].
        std::unordered_map<size_t, size_t> j2len;
        std::unordered_map<size_t, size_t> newj2len;
        for(size_t i = alo; i < ahi; ++i) {
            newj2len.clear();
            auto it = b2j.find(a[i]);
            if(it != b2j.end()) {
                for(const size_t j : it->second) {
                    if(j < blo) {
                        continue;
                    }
                    if(j >= bhi) {
                        break;
                    }
                    size_t k = 1;
                    if(j > 0) {
                        auto prev = j2len.find(j - 1);
                        if(prev != j2len.end()) {
                            k = prev->second + 1;
                        }
                    }
                    newj2len[j] = k;
                    if(k > bestsize) {
                        besti = i + 1 - k;
                        bestj = j + 1 - k;
                        bestsize = k;
                    }
                }
            }
            std::swap(j2len, newj2len);
        }
        // Popular elements are not indexed but may still extend a match.
        while(besti > alo && bestj > blo && a[besti - 1] == b[bestj - 1]) {
            --besti;
            --bestj;
            ++bestsize;
        }
        while(besti + bestsize < ahi && bestj + bestsize < bhi &&
              a[besti + bestsize] == b[bestj + bestsize]) {
            ++bestsize;
        }
        return MatchBlock{besti, bestj, bestsize};
    }

    // Sorted, adjacent blocks merged, terminated by {len(a), len(b), 0}.
    const std::vector<MatchBlock> &matching_blocks() const { return blocks; }

    std::vector<EditOp> opcodes() const {
        std::vector<EditOp> ops;
        size_t i = 0;
        size_t j = 0;
        for(const auto &block : blocks) {
            if(i < block.a && j < block.b) {
                ops.emplace_back(EditOp{DiffTag::Replace, i, block.a, j, block.b});
            } else if(i < block.a) {
                ops.emplace_back(EditOp{DiffTag::Delete, i, block.a, j, block.b});
            } else if(j < block.b) {
                ops.emplace_back(EditOp{DiffTag::Insert, i, block.a, j, block.b});
            }
            i = block.a + block.size;
            j = block.b + block.size;
            if(block.size > 0) {
                ops.emplace_back(EditOp{DiffTag::Equal, block.a, i, block.b, j});
            }
        }
        return ops;
    }

    // Hunks of changes with up to `context` unchanged elements around them.
    std::vector<std::vector<EditOp>> grouped_opcodes(size_t context = 3) const {
        auto codes = opcodes();
        if(codes.empty()) {
            codes.emplace_back(EditOp{DiffTag::Equal, 0, 1, 0, 1});
        }
        auto &first = codes.front();
        if(first.tag == DiffTag::Equal) {
            first.i1 = std::max(first.i1, first.i2 > context ? first.i2 - context : 0);
            first.j1 = std::max(first.j1, first.j2 > context ? first.j2 - context : 0);
        }
        auto &last = codes.back();
        if(last.tag == DiffTag::Equal) {
            last.i2 = std::min(last.i2, last.i1 + context);
            last.j2 = std::min(last.j2, last.j1 + context);
        }

        std::vector<std::vector<EditOp>> groups;
        std::vector<EditOp> group;
        for(auto op : codes) {
            if(op.tag == DiffTag::Equal && op.a_len() > 2 * context) {
                group.emplace_back(EditOp{DiffTag::Equal,
                                          op.i1,
                                          std::min(op.i2, op.i1 + context),
                                          op.j1,
                                          std::min(op.j2, op.j1 + context)});
                groups.emplace_back(std::move(group));
                group.clear();
                op.i1 = std::max(op.i1, op.i2 - context);
                op.j1 = std::max(op.j1, op.j2 - context);
            }
            group.push_back(op);
        }
        if(!group.empty() && !(group.size() == 1 && group.front().tag == DiffTag::Equal)) {
            groups.emplace_back(std::move(group));
        }
        return groups;
    }

    size_t matched_count() const {
        size_t total = 0;
        for(const auto &block : blocks) {
            total += block.size;
        }
        return total;
    }

    double ratio() const {
        const size_t total_len = a.size() + b.size();
        if(total_len == 0) {
            return 1.0;
        }
        return 2.0 * double(matched_count()) / double(total_len);
    }

private:
    void index_b(bool autojunk) {
        for(size_t j = 0; j < b.size(); ++j) {
            b2j[b[j]].push_back(j);
        }
        const size_t n = b.size();
        if(autojunk && n >= 200) {
            const size_t ntest = n / 100 + 1;
            for(auto it = b2j.begin(); it != b2j.end();) {
                if(it->second.size() > ntest) {
                    it = b2j.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    void compute_blocks() {
        typedef std::tuple<size_t, size_t, size_t, size_t> Range;
        std::vector<Range> queue;
        std::vector<MatchBlock> found;
        queue.emplace_back(0, a.size(), 0, b.size());
        while(!queue.empty()) {
            const auto [alo, ahi, blo, bhi] = queue.back();
            queue.pop_back();
            const auto m = find_longest_match(alo, ahi, blo, bhi);
            if(m.size == 0) {
                continue;
            }
            found.push_back(m);
            if(alo < m.a && blo < m.b) {
                queue.emplace_back(alo, m.a, blo, m.b);
            }
            if(m.a + m.size < ahi && m.b + m.size < bhi) {
                queue.emplace_back(m.a + m.size, ahi, m.b + m.size, bhi);
            }
        }
        std::sort(found.begin(), found.end(), [](const MatchBlock &l, const MatchBlock &r) {
            return std::tie(l.a, l.b, l.size) < std::tie(r.a, r.b, r.size);
        });

        MatchBlock current{0, 0, 0};
        for(const auto &m : found) {
            if(current.a + current.size == m.a && current.b + current.size == m.b) {
                current.size += m.size;
            } else {
                if(current.size > 0) {
                    blocks.push_back(current);
                }
                current = m;
            }
        }
        if(current.size > 0) {
            blocks.push_back(current);
        }
        blocks.emplace_back(MatchBlock{a.size(), b.size(), 0});
    }

    std::span<const T> a;
    std::span<const T> b;
    std::unordered_map<T, std::vector<size_t>> b2j;
    std::vector<MatchBlock> blocks;
};
