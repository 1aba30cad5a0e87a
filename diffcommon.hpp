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

#include <optional>
#include <string>
#include <vector>
#include <cstddef>

struct PageText {
    size_t index;
    std::string content; // Empty for image-only and blank pages.
};

// Axis aligned, in whatever unit space the owner uses. PDF points with
// the origin at top left for extracted words.
struct BBox {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }

    bool operator==(const BBox &o) const noexcept = default;
};

struct Word {
    std::string text;
    BBox bbox;
};

struct PageSize {
    double w = 0.0;
    double h = 0.0;
};

enum class DiffTag : int {
    Equal,
    Replace,
    Insert,
    Delete,
};

// a_range is [i1, i2), b_range is [j1, j2).
struct EditOp {
    DiffTag tag;
    size_t i1, i2;
    size_t j1, j2;

    size_t a_len() const { return i2 - i1; }
    size_t b_len() const { return j2 - j1; }

    bool operator==(const EditOp &o) const noexcept = default;
};

typedef EditOp AlignmentOp;
typedef EditOp WordDiffOp;
typedef std::vector<AlignmentOp> AlignmentPlan;

enum class Side : int {
    A,
    B,
};

enum class HighlightKind : int {
    Added,
    Removed,
};

struct HighlightRegion {
    Side side;
    BBox bbox; // Output coordinate space.
    HighlightKind kind;
};

struct PageComparisonResult {
    std::optional<size_t> a_index;
    std::optional<size_t> b_index;
    bool shifted = false;
    std::vector<HighlightRegion> regions;

    bool is_pair() const { return a_index && b_index; }
    bool has_changes() const { return !regions.empty(); }
};

const char *tag_name(DiffTag tag);

// True if the ops tile [0, len_a) and [0, len_b) in order, each index exactly once.
bool ops_cover(const std::vector<EditOp> &ops, size_t len_a, size_t len_b);
