/**
 * @file PdfWriter.hpp
 * @brief Minimal markdown-to-PDF renderer (headings and wrapped paragraphs).
 */

#pragma once
#include <string>

namespace docgen::infrastructure {

/**
 * @class PdfWriter
 * @brief Renders markdown into a single PDF 1.4 document using the core Helvetica fonts.
 *
 * Lines starting with '#', '##' or '###' become bold headings; every other
 * line is word-wrapped body text. Characters outside Latin-1 print as '?'.
 */
class PdfWriter {
public:
    static std::string RenderMarkdown(const std::string& markdown);
};

} // namespace docgen::infrastructure
