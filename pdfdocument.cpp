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

#include <pdfdocument.hpp>
#include <utils.hpp>

#include <cassert>
#include <stdexcept>

PdfDocument::PdfDocument(const char *path) : fname{path} {
    GError *err = nullptr;
    gchar *absolute = g_canonicalize_filename(path, nullptr);
    gchar *uri = g_filename_to_uri(absolute, nullptr, &err);
    g_free(absolute);
    if(!uri) {
        std::string msg{"Could not convert "};
        msg += path;
        msg += " to a URI: ";
        msg += err->message;
        g_error_free(err);
        throw std::runtime_error(msg);
    }
    doc = poppler_document_new_from_file(uri, nullptr, &err);
    g_free(uri);
    if(!doc) {
        std::string msg{"Error opening "};
        msg += path;
        msg += ": ";
        msg += err->message;
        g_error_free(err);
        throw std::runtime_error(msg);
    }
    pages = size_t(poppler_document_get_n_pages(doc));
}

PdfDocument::~PdfDocument() { g_object_unref(doc); }

PageHandle PdfDocument::get_page(size_t page) const {
    assert(page < pages);
    PageHandle p(poppler_document_get_page(doc, int(page)));
    if(!p) {
        std::string msg{"Could not load page "};
        msg += std::to_string(page + 1);
        msg += " of ";
        msg += fname;
        msg += '.';
        throw std::runtime_error(msg);
    }
    return p;
}

PageSize PdfDocument::page_size(size_t page) const {
    auto p = get_page(page);
    PageSize s;
    poppler_page_get_size(p.get(), &s.w, &s.h);
    return s;
}

std::vector<PageSize> PdfDocument::page_sizes() const {
    std::vector<PageSize> sizes;
    sizes.reserve(pages);
    for(size_t i = 0; i < pages; ++i) {
        sizes.push_back(page_size(i));
    }
    return sizes;
}

std::string PdfDocument::page_text(size_t page) const {
    auto p = get_page(page);
    char *text = poppler_page_get_text(p.get());
    if(!text) {
        return std::string{};
    }
    std::string result{text};
    g_free(text);
    return result;
}

std::vector<PageText> PdfDocument::extract_text() const {
    std::vector<PageText> texts;
    texts.reserve(pages);
    for(size_t i = 0; i < pages; ++i) {
        texts.emplace_back(PageText{i, page_text(i)});
    }
    return texts;
}

std::vector<Word> PdfDocument::extract_words(size_t page) const {
    auto p = get_page(page);
    char *text = poppler_page_get_text(p.get());
    if(!text) {
        return {};
    }
    std::string page_text{text};
    g_free(text);

    PopplerRectangle *rects = nullptr;
    guint n_rects = 0;
    std::vector<BBox> boxes;
    if(poppler_page_get_text_layout(p.get(), &rects, &n_rects)) {
        boxes.reserve(n_rects);
        for(guint i = 0; i < n_rects; ++i) {
            boxes.emplace_back(BBox{rects[i].x1, rects[i].y1, rects[i].x2, rects[i].y2});
        }
        g_free(rects);
    }
    return words_from_layout(page_text, boxes);
}

void PdfDocument::render_page(size_t page, cairo_t *cr) const {
    auto p = get_page(page);
    poppler_page_render(p.get(), cr);
}
