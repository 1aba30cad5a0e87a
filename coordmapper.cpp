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

BBox map_bbox(const BBox &box, double scale_x, double scale_y, double offset_x, double offset_y) {
    return BBox{box.x0 * scale_x + offset_x,
                box.y0 * scale_y + offset_y,
                box.x1 * scale_x + offset_x,
                box.y1 * scale_y + offset_y};
}

PagePlacement
fit_placement(const PageSize &source, const PageSize &target, double offset_x, double offset_y) {
    PagePlacement p;
    p.scale_x = source.w > 0 ? target.w / source.w : 1.0;
    p.scale_y = source.h > 0 ? target.h / source.h : 1.0;
    p.offset_x = offset_x;
    p.offset_y = offset_y;
    return p;
}

PagePlacement compose_placements(const PagePlacement &first, const PagePlacement &second) {
    PagePlacement p;
    p.scale_x = first.scale_x * second.scale_x;
    p.scale_y = first.scale_y * second.scale_y;
    p.offset_x = first.offset_x * second.scale_x + second.offset_x;
    p.offset_y = first.offset_y * second.scale_y + second.offset_y;
    return p;
}
