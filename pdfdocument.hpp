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

#include <poppler.h>
#include <cairo.h>

#include <memory>
#include <string>
#include <vector>

struct PopplerPageUnref {
    void operator()(PopplerPage *p) const noexcept { g_object_unref(p); }
};

typedef std::unique_ptr<PopplerPage, PopplerPageUnref> PageHandle;

// Read only view of a PDF file. Word coordinates are in points with the
// origin at the top left corner of the page.
class PdfDocument {
public:
    explicit PdfDocument(const char *path);
    ~PdfDocument();

    PdfDocument(const PdfDocument &) = delete;
    PdfDocument &operator=(const PdfDocument &) = delete;

    size_t num_pages() const { return pages; }
    const std::string &path() const { return fname; }

    PageSize page_size(size_t page) const;
    std::vector<PageSize> page_sizes() const;

    std::string page_text(size_t page) const;
    std::vector<PageText> extract_text() const;
    std::vector<Word> extract_words(size_t page) const;

    // Draws the page at the current origin, one unit per point.
    void render_page(size_t page, cairo_t *cr) const;

private:
    PageHandle get_page(size_t page) const;

    PopplerDocument *doc;
    size_t pages;
    std::string fname;
};
