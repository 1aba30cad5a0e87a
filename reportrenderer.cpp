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

#include <reportrenderer.hpp>
#include <utils.hpp>

#include <cairo-pdf.h>

#include <cassert>
#include <stdexcept>

namespace {

const Color white{1, 1, 1};
const Color black{0, 0, 0};
const Color missing_bg{1, 0.8, 0.8};
const Color added_bg{0.8, 1, 0.8};
const Color removed_stroke{1, 0, 0};
const Color removed_fill{1, 0.7, 0.7};
const Color added_stroke{0, 1, 0};
const Color added_fill{0.7, 1, 0.7};
const Color shift_border{1, 1, 0};
const Color shift_text{0.8, 0.6, 0};

const double highlight_alpha = 0.3;

std::string page_label(const char *prefix, size_t page) {
    std::string label{prefix};
    label += " - Page ";
    label += std::to_string(page + 1);
    return label;
}

} // namespace

ReportRenderer::ReportRenderer(const char *ofname,
                               const ReportLayout &layout_,
                               const ReportStyle &style_,
                               const char *title_)
    : layout{layout_}, style{style_}, outname{ofname}, title{title_} {
    if(layout.is_raster()) {
        // Raster pages are created one by one in begin_page.
        return;
    }
    // The real size is set separately for every page.
    surf = cairo_pdf_surface_create(ofname, 595, 842);
    if(cairo_surface_status(surf) != CAIRO_STATUS_SUCCESS) {
        std::string msg{"Could not create "};
        msg += ofname;
        msg += ": ";
        msg += cairo_status_to_string(cairo_surface_status(surf));
        cairo_surface_destroy(surf);
        throw std::runtime_error(msg);
    }
    const auto date = current_date();
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_TITLE, title.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_CREATOR, "pagediff");
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_CREATE_DATE, date.c_str());
    cr = cairo_create(surf);
    pl = pango_cairo_create_layout(cr);
}

ReportRenderer::~ReportRenderer() {
    if(pl) {
        g_object_unref(G_OBJECT(pl));
    }
    if(cr) {
        cairo_destroy(cr);
    }
    if(surf) {
        cairo_surface_destroy(surf);
    }
}

void ReportRenderer::check_status(const char *what) const {
    auto status = cairo_status(cr);
    if(status == CAIRO_STATUS_SUCCESS) {
        status = cairo_surface_status(surf);
    }
    if(status != CAIRO_STATUS_SUCCESS) {
        std::string msg{what};
        msg += ": ";
        msg += cairo_status_to_string(status);
        throw std::runtime_error(msg);
    }
}

void ReportRenderer::begin_page(const PageSize &size) {
    if(layout.is_raster()) {
        surf = cairo_image_surface_create(CAIRO_FORMAT_RGB24, int(size.w), int(size.h));
        cr = cairo_create(surf);
        pl = pango_cairo_create_layout(cr);
        check_status("Could not create page image");
    } else {
        cairo_pdf_surface_set_size(surf, size.w, size.h);
    }
    cairo_save(cr);
    cairo_set_source_rgb(cr, white.r, white.g, white.b);
    cairo_rectangle(cr, 0, 0, size.w, size.h);
    cairo_fill(cr);
    cairo_restore(cr);
}

void ReportRenderer::end_page() {
    ++pages;
    if(!layout.is_raster()) {
        cairo_show_page(cr);
        check_status("Could not write report page");
        return;
    }
    cairo_surface_flush(surf);
    const auto png_name = numbered_png_name(outname, pages);
    const auto rc = cairo_surface_write_to_png(surf, png_name.c_str());
    g_object_unref(G_OBJECT(pl));
    cairo_destroy(cr);
    cairo_surface_destroy(surf);
    pl = nullptr;
    cr = nullptr;
    surf = nullptr;
    if(rc != CAIRO_STATUS_SUCCESS) {
        std::string msg{"Could not write "};
        msg += png_name;
        msg += ": ";
        msg += cairo_status_to_string(rc);
        throw std::runtime_error(msg);
    }
}

void ReportRenderer::finish() {
    if(finished) {
        return;
    }
    finished = true;
    if(layout.is_raster()) {
        return;
    }
    cairo_surface_finish(surf);
    check_status("Could not write report");
}

bool ReportRenderer::render(const PageComparisonResult &result,
                            const PdfDocument &doc_a,
                            const PdfDocument &doc_b) {
    assert(!finished);
    if(result.is_pair() && style.skip_identical && !result.has_changes() && !result.shifted) {
        return false;
    }
    const auto size = layout.report_page_size(result);
    begin_page(size);
    if(result.is_pair()) {
        render_pair(result, doc_a, doc_b, size);
    } else {
        render_singleton(result, doc_a, doc_b);
    }
    end_page();
    return true;
}

void ReportRenderer::render_pair(const PageComparisonResult &result,
                                 const PdfDocument &doc_a,
                                 const PdfDocument &doc_b,
                                 const PageSize &size) {
    const size_t idx_a = *result.a_index;
    const size_t idx_b = *result.b_index;
    draw_source_page(doc_a, Side::A, idx_a);
    draw_source_page(doc_b, Side::B, idx_b);

    auto label_a = page_label("Original", idx_a);
    if(!result.has_changes() && !result.shifted) {
        label_a += " (No Differences)";
    }
    draw_label(label_a, Side::A, white);
    draw_label(page_label("Modified", idx_b), Side::B, white);

    for(const auto &region : result.regions) {
        draw_highlight(region);
    }
    if(result.shifted) {
        draw_shift_marker(size);
    }
}

void ReportRenderer::render_singleton(const PageComparisonResult &result,
                                      const PdfDocument &doc_a,
                                      const PdfDocument &doc_b) {
    if(result.a_index) {
        const size_t idx = *result.a_index;
        draw_source_page(doc_a, Side::A, idx);
        draw_blank_column(Side::B, layout.target_size(Side::A, idx).h);
        draw_label(page_label("Missing", idx), Side::A, missing_bg);
        draw_label("No Corresponding Page", Side::B, white);
    } else {
        const size_t idx = *result.b_index;
        draw_source_page(doc_b, Side::B, idx);
        draw_blank_column(Side::A, layout.target_size(Side::B, idx).h);
        draw_label("No Corresponding Page", Side::A, white);
        draw_label(page_label("Added", idx), Side::B, added_bg);
    }
}

void ReportRenderer::draw_source_page(const PdfDocument &doc, Side side, size_t page) {
    const auto p = layout.placement(side, page);
    const auto src = layout.source_size(side, page);
    cairo_save(cr);
    cairo_translate(cr, p.offset_x, p.offset_y);
    cairo_scale(cr, p.scale_x, p.scale_y);
    cairo_rectangle(cr, 0, 0, src.w, src.h);
    cairo_set_source_rgb(cr, white.r, white.g, white.b);
    cairo_fill_preserve(cr);
    cairo_clip(cr);
    doc.render_page(page, cr);
    cairo_restore(cr);
}

void ReportRenderer::draw_blank_column(Side side, double h) {
    cairo_save(cr);
    cairo_rectangle(cr, layout.column_x(side), layout.content_y(), layout.column_width(side), h);
    cairo_set_source_rgb(cr, 0.98, 0.98, 0.98);
    cairo_fill_preserve(cr);
    cairo_set_source_rgb(cr, 0.9, 0.9, 0.9);
    cairo_set_line_width(cr, layout.to_target(1));
    cairo_stroke(cr);
    cairo_restore(cr);
}

void ReportRenderer::draw_label(const std::string &text, Side side, const Color &bg) {
    const double x = layout.column_x(side);
    const double y = layout.label_y();
    const double w = layout.column_width(side);
    const double h = layout.to_target(0.75 * layout.parameters().label_height);
    cairo_save(cr);
    cairo_rectangle(cr, x, y, w, h);
    cairo_set_source_rgb(cr, bg.r, bg.g, bg.b);
    cairo_fill_preserve(cr);
    cairo_set_source_rgb(cr, black.r, black.g, black.b);
    cairo_set_line_width(cr, layout.to_target(1));
    cairo_stroke(cr);
    cairo_restore(cr);

    setup_pango();
    pango_layout_set_text(pl, text.c_str(), -1);
    PangoRectangle r;
    pango_layout_get_pixel_extents(pl, nullptr, &r);
    render_text(text.c_str(), x + layout.to_target(5), y + (h - r.height) / 2, black);
}

void ReportRenderer::draw_highlight(const HighlightRegion &region) {
    const bool removed = region.kind == HighlightKind::Removed;
    const auto &fill = removed ? removed_fill : added_fill;
    const auto &stroke = removed ? removed_stroke : added_stroke;
    const auto &b = region.bbox;
    cairo_save(cr);
    cairo_rectangle(cr, b.x0, b.y0, b.width(), b.height());
    cairo_set_source_rgba(cr, fill.r, fill.g, fill.b, highlight_alpha);
    cairo_fill_preserve(cr);
    cairo_set_source_rgb(cr, stroke.r, stroke.g, stroke.b);
    cairo_set_line_width(cr, layout.to_target(0.5));
    cairo_stroke(cr);
    cairo_restore(cr);
}

void ReportRenderer::draw_shift_marker(const PageSize &size) {
    const double inset = layout.to_target(5);
    cairo_save(cr);
    cairo_rectangle(cr, inset, inset, size.w - 2 * inset, size.h - 2 * inset);
    cairo_set_source_rgb(cr, shift_border.r, shift_border.g, shift_border.b);
    cairo_set_line_width(cr, layout.to_target(3));
    cairo_stroke(cr);
    cairo_restore(cr);

    const char *caption = "(Page Shifted)";
    setup_pango();
    pango_layout_set_text(pl, caption, -1);
    PangoRectangle r;
    pango_layout_get_pixel_extents(pl, nullptr, &r);
    render_text(caption, (size.w - r.width) / 2, size.h - inset - layout.to_target(5) - r.height, shift_text);
}

void ReportRenderer::setup_pango() {
    PangoFontDescription *desc = pango_font_description_from_string(style.label_font.c_str());
    pango_font_description_set_absolute_size(desc, layout.to_target(style.label_size) * PANGO_SCALE);
    pango_layout_set_font_description(pl, desc);
    pango_font_description_free(desc);
}

void ReportRenderer::render_text(const char *text, double x, double y, const Color &color) {
    setup_pango();
    cairo_save(cr);
    cairo_set_source_rgb(cr, color.r, color.g, color.b);
    cairo_move_to(cr, x, y);
    pango_layout_set_attributes(pl, nullptr);
    pango_layout_set_text(pl, text, -1);
    pango_cairo_update_layout(cr, pl);
    pango_cairo_show_layout(cr, pl);
    cairo_restore(cr);
}
