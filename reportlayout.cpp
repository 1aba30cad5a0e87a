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

#include <reportlayout.hpp>
#include <units.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>

namespace {

double widest(const std::vector<PageSize> &sizes) {
    double w = 0;
    for(const auto &s : sizes) {
        w = std::max(w, s.w);
    }
    return w;
}

} // namespace

ReportLayout::ReportLayout(const LayoutParameters &par_,
                           std::vector<PageSize> sizes_a_,
                           std::vector<PageSize> sizes_b_)
    : par{par_}, sizes_a{std::move(sizes_a_)}, sizes_b{std::move(sizes_b_)} {
    col_a = widest(sizes_a);
    col_b = widest(sizes_b);
    // The blank side of a singleton page still needs some width.
    if(sizes_a.empty()) {
        col_a = col_b;
    }
    if(sizes_b.empty()) {
        col_b = col_a;
    }
}

double ReportLayout::to_target(double points) const {
    return is_raster() ? pt2px(points, par.dpi) : points;
}

PageSize ReportLayout::source_size(Side side, size_t page) const {
    const auto &sizes = side == Side::A ? sizes_a : sizes_b;
    assert(page < sizes.size());
    return sizes[page];
}

PageSize ReportLayout::target_size(Side side, size_t page) const {
    const auto s = source_size(side, page);
    if(!is_raster()) {
        return s;
    }
    // Whole pixels, like a page rasterizer would produce.
    return PageSize{std::floor(pt2px(s.w, par.dpi)), std::floor(pt2px(s.h, par.dpi))};
}

double ReportLayout::column_x(Side side) const {
    if(side == Side::A) {
        return to_target(par.margin);
    }
    return to_target(par.margin + col_a + par.gap);
}

double ReportLayout::column_width(Side side) const {
    return to_target(side == Side::A ? col_a : col_b);
}

double ReportLayout::label_y() const { return to_target(par.margin); }

double ReportLayout::content_y() const { return to_target(par.margin + par.label_height); }

PagePlacement ReportLayout::placement(Side side, size_t page) const {
    return fit_placement(
        source_size(side, page), target_size(side, page), column_x(side), content_y());
}

PageSize ReportLayout::report_page_size(const PageComparisonResult &result) const {
    double content_h = 0;
    if(result.a_index) {
        content_h = std::max(content_h, target_size(Side::A, *result.a_index).h);
    }
    if(result.b_index) {
        content_h = std::max(content_h, target_size(Side::B, *result.b_index).h);
    }
    PageSize size;
    size.w = to_target(2 * par.margin + col_a + par.gap + col_b);
    size.h = to_target(2 * par.margin + par.label_height) + content_h;
    if(is_raster()) {
        size.w = std::ceil(size.w);
        size.h = std::ceil(size.h);
    }
    return size;
}
