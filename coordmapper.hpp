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

// Affine map from a page's native space into the report's space:
// x' = x * scale_x + offset_x, y' = y * scale_y + offset_y.
struct PagePlacement {
    double scale_x = 1.0;
    double scale_y = 1.0;
    double offset_x = 0.0;
    double offset_y = 0.0;
};

BBox map_bbox(const BBox &box, double scale_x, double scale_y, double offset_x, double offset_y);

// Boxes with x1 < x0 or y1 < y0 are mapped as is, not fixed up.
inline BBox map_bbox(const BBox &box, const PagePlacement &p) {
    return map_bbox(box, p.scale_x, p.scale_y, p.offset_x, p.offset_y);
}

// Scales are target / source per axis, so the two axes may differ.
PagePlacement
fit_placement(const PageSize &source, const PageSize &target, double offset_x, double offset_y);

// Equivalent to applying first, then second.
PagePlacement compose_placements(const PagePlacement &first, const PagePlacement &second);
