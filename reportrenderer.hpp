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
#include <reportlayout.hpp>
#include <pdfdocument.hpp>

#include <cairo.h>
#include <pango/pangocairo.h>

#include <string>

struct Color {
    double r, g, b;
};

/*
 * Draws comparison results as report pages. Vector layouts go into a single
 * PDF file, raster layouts become one PNG file per report page.
 */
class ReportRenderer {
public:
    explicit ReportRenderer(const char *ofname,
                            const ReportLayout &layout,
                            const ReportStyle &style,
                            const char *title);
    ~ReportRenderer();

    ReportRenderer(const ReportRenderer &) = delete;
    ReportRenderer &operator=(const ReportRenderer &) = delete;

    // Returns false if the page was skipped.
    bool render(const PageComparisonResult &result,
                const PdfDocument &doc_a,
                const PdfDocument &doc_b);

    // Flushes the output. Errors are thrown from here.
    void finish();

    int page_num() const { return pages; }

private:
    void begin_page(const PageSize &size);
    void end_page();

    void render_pair(const PageComparisonResult &result,
                     const PdfDocument &doc_a,
                     const PdfDocument &doc_b,
                     const PageSize &size);
    void render_singleton(const PageComparisonResult &result,
                          const PdfDocument &doc_a,
                          const PdfDocument &doc_b);

    void draw_source_page(const PdfDocument &doc, Side side, size_t page);
    void draw_blank_column(Side side, double h);
    void draw_label(const std::string &text, Side side, const Color &bg);
    void draw_highlight(const HighlightRegion &region);
    void draw_shift_marker(const PageSize &size);
    void render_text(const char *text, double x, double y, const Color &color);
    void setup_pango();
    void check_status(const char *what) const;

    const ReportLayout &layout;
    ReportStyle style;
    std::string outname;
    std::string title;
    int pages = 0;
    bool finished = false;
    cairo_surface_t *surf = nullptr;
    cairo_t *cr = nullptr;
    PangoLayout *pl = nullptr;
};
