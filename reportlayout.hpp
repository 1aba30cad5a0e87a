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
#include <reportplanner.hpp>

#include <string>
#include <vector>

// All lengths in points.
struct LayoutParameters {
    double margin = 20;
    double gap = 10;
    double label_height = 40;
    // Zero means vector output in points, otherwise pixels at this resolution.
    double dpi = 0;
};

struct ReportStyle {
    std::string label_font = "Sans";
    double label_size = 12; // Points.
    bool skip_identical = false;
};

/*
 * Side by side report geometry. Document A is drawn in the left column and
 * document B in the right one. Each column is as wide as the widest page of
 * its document so that a page always lands in the same place no matter which
 * page it is paired with.
 *
 * Everything returned is in target units: points for vector output and
 * pixels for raster output.
 */
class ReportLayout {
public:
    ReportLayout(const LayoutParameters &par,
                 std::vector<PageSize> sizes_a,
                 std::vector<PageSize> sizes_b);

    bool is_raster() const { return par.dpi > 0; }
    const LayoutParameters &parameters() const { return par; }

    double to_target(double points) const;

    PageSize source_size(Side side, size_t page) const;
    PageSize target_size(Side side, size_t page) const;

    double column_x(Side side) const;
    double column_width(Side side) const;
    double content_y() const;
    double label_y() const;

    PagePlacement placement(Side side, size_t page) const;
    PageSize report_page_size(const PageComparisonResult &result) const;

    LayoutLookup lookup() const {
        return [this](Side side, size_t page) { return placement(side, page); };
    }

private:
    LayoutParameters par;
    std::vector<PageSize> sizes_a;
    std::vector<PageSize> sizes_b;
    double col_a = 0; // Points.
    double col_b = 0;
};
