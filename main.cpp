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

#include <config.hpp>
#include <pagealigner.hpp>
#include <pdfdocument.hpp>
#include <reportlayout.hpp>
#include <reportplanner.hpp>
#include <reportrenderer.hpp>
#include <textdiff.hpp>
#include <utils.hpp>

#include <glib.h>

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace {

gchar *output_name = nullptr;
gchar *config_file = nullptr;
// NaN and G_MININT mark options that were not given.
gdouble dpi = NAN;
gdouble threshold = NAN;
gint lookahead = G_MININT;
gboolean print_text = FALSE;
gboolean skip_identical = FALSE;
gboolean verbose = FALSE;
gchar **file_args = nullptr;

GOptionEntry entries[] = {
    {"output", 'o', 0, G_OPTION_ARG_FILENAME, &output_name, "Report file (default: report.pdf)", "FILE"},
    {"config", 'c', 0, G_OPTION_ARG_FILENAME, &config_file, "JSON configuration file", "FILE"},
    {"dpi", 0, 0, G_OPTION_ARG_DOUBLE, &dpi, "Write PNG pages at this resolution", "DPI"},
    {"threshold",
     0,
     0,
     G_OPTION_ARG_DOUBLE,
     &threshold,
     "Page similarity threshold (default: 0.6)",
     "RATIO"},
    {"lookahead", 0, 0, G_OPTION_ARG_INT, &lookahead, "Page lookahead window (default: 3)", "N"},
    {"text", 't', 0, G_OPTION_ARG_NONE, &print_text, "Print a unified diff of the text", nullptr},
    {"skip-identical",
     's',
     0,
     G_OPTION_ARG_NONE,
     &skip_identical,
     "Leave unchanged page pairs out of the report",
     nullptr},
    {"verbose", 'v', 0, G_OPTION_ARG_NONE, &verbose, "Print progress", nullptr},
    {G_OPTION_REMAINING, 0, 0, G_OPTION_ARG_FILENAME_ARRAY, &file_args, nullptr, "FILE_A FILE_B"},
    {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}};

CompareConfig build_config() {
    CompareConfig config;
    if(config_file) {
        config = load_config(config_file);
    }
    ConfigOverrides overrides;
    if(!std::isnan(dpi)) {
        overrides.dpi = dpi;
    }
    if(!std::isnan(threshold)) {
        overrides.threshold = threshold;
    }
    if(lookahead != G_MININT) {
        overrides.lookahead = lookahead;
    }
    overrides.skip_identical = skip_identical;
    apply_overrides(config, overrides);
    return config;
}

void print_plan(const AlignmentPlan &plan) {
    for(const auto &op : plan) {
        printf("  %-7s A[%d, %d) B[%d, %d)\n",
               tag_name(op.tag),
               int(op.i1),
               int(op.i2),
               int(op.j1),
               int(op.j2));
    }
}

int compare(const char *file_a, const char *file_b, const char *ofname) {
    const auto config = build_config();
    printf("Comparing '%s' and '%s'...\n", file_a, file_b);

    PdfDocument doc_a(file_a);
    PdfDocument doc_b(file_b);
    const auto text_a = doc_a.extract_text();
    const auto text_b = doc_b.extract_text();
    if(verbose) {
        printf("%s has %d pages, %s has %d pages.\n",
               file_a,
               int(doc_a.num_pages()),
               file_b,
               int(doc_b.num_pages()));
    }

    if(print_text) {
        for(const auto &line : unified_text_diff(text_a, text_b)) {
            printf("%s\n", line.c_str());
        }
    }

    const auto plan = align_pages(text_a, text_b, config.alignment);
    if(verbose) {
        printf("Page alignment:\n");
        print_plan(plan);
    }

    ReportLayout layout(config.layout, doc_a.page_sizes(), doc_b.page_sizes());
    WordLookup words = [&doc_a, &doc_b](Side side, size_t page) {
        return side == Side::A ? doc_a.extract_words(page) : doc_b.extract_words(page);
    };
    const auto results = plan_report(plan, words, layout.lookup());

    std::string title{"Comparison of "};
    title += file_a;
    title += " and ";
    title += file_b;
    ReportRenderer renderer(ofname, layout, config.report, title.c_str());
    for(const auto &r : results) {
        const bool written = renderer.render(r, doc_a, doc_b);
        if(verbose) {
            printf("  A %3s  B %3s  %3d changed words%s%s\n",
                   r.a_index ? std::to_string(*r.a_index + 1).c_str() : "-",
                   r.b_index ? std::to_string(*r.b_index + 1).c_str() : "-",
                   int(r.regions.size()),
                   r.shifted ? ", shifted" : "",
                   written ? "" : ", skipped");
        }
    }
    renderer.finish();

    const auto s = summarize(results);
    printf("Compared %d page pairs: %d changed, %d shifted, %d added, %d missing.\n",
           int(s.pairs),
           int(s.changed),
           int(s.shifted),
           int(s.added),
           int(s.removed));
    if(layout.is_raster()) {
        printf("Wrote %d report pages as %s.\n",
               renderer.page_num(),
               numbered_png_name(ofname, 1).c_str());
    } else {
        printf("Wrote %d report pages to %s.\n", renderer.page_num(), ofname);
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    GError *err = nullptr;
    GOptionContext *context = g_option_context_new("- compare two PDF files page by page");
    g_option_context_add_main_entries(context, entries, nullptr);
    if(!g_option_context_parse(context, &argc, &argv, &err)) {
        fprintf(stderr, "%s\n", err->message);
        g_error_free(err);
        g_option_context_free(context);
        return 1;
    }
    if(!file_args || g_strv_length(file_args) != 2) {
        gchar *help = g_option_context_get_help(context, TRUE, nullptr);
        fprintf(stderr, "%s", help);
        g_free(help);
        g_option_context_free(context);
        return 1;
    }
    g_option_context_free(context);

    for(int i = 0; i < 2; ++i) {
        if(!g_file_test(file_args[i], G_FILE_TEST_IS_REGULAR)) {
            fprintf(stderr, "Error: File '%s' not found.\n", file_args[i]);
            return 1;
        }
    }

    int rc = 1;
    try {
        rc = compare(file_args[0], file_args[1], output_name ? output_name : "report.pdf");
    } catch(const std::exception &e) {
        fprintf(stderr, "Error: %s\n", e.what());
    }
    g_strfreev(file_args);
    g_free(output_name);
    g_free(config_file);
    return rc;
}
