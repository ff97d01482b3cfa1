/**
 * @file PdfWriter.cpp
 * @brief Implementation of PdfWriter.
 */

#include "infrastructure/PdfWriter.hpp"

#include <cstdio>
#include <sstream>
#include <vector>

namespace docgen::infrastructure {

namespace {

constexpr double kPageWidth = 595.0;   // A4 in points
constexpr double kPageHeight = 842.0;
constexpr double kMargin = 42.5;       // 15 mm
constexpr double kBodySize = 12.0;
constexpr double kAvgGlyphWidth = 0.5; // Helvetica average advance, in em

struct TextLine {
    std::string text;
    bool bold = false;
    double size = kBodySize;
    double leading = 16.0;
};

// UTF-8 to Latin-1; anything beyond U+00FF becomes '?'.
std::string ToLatin1(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    for (std::size_t i = 0; i < utf8.size();) {
        unsigned char c = static_cast<unsigned char>(utf8[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }
        int extra = (c & 0xE0) == 0xC0 ? 1 : (c & 0xF0) == 0xE0 ? 2 : (c & 0xF8) == 0xF0 ? 3 : 0;
        if (extra == 1 && i + 1 < utf8.size()) {
            unsigned int cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(utf8[i + 1]) & 0x3Fu);
            out.push_back(cp <= 0xFF ? static_cast<char>(cp) : '?');
        } else {
            out.push_back('?');
        }
        i += 1 + extra;
    }
    return out;
}

std::string StripInlineMarkup(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '`') continue;
        if (text[i] == '*' && i + 1 < text.size() && text[i + 1] == '*') {
            ++i;
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string EscapePdfString(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char ch : text) {
        if (ch == '\\' || ch == '(' || ch == ')') out.push_back('\\');
        if (ch == '\t') {
            out += "    ";
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

void WrapInto(const std::string& text, const TextLine& style, std::vector<TextLine>& lines) {
    std::size_t maxChars = static_cast<std::size_t>((kPageWidth - 2 * kMargin) / (style.size * kAvgGlyphWidth));
    if (maxChars < 8) maxChars = 8;

    std::istringstream words(text);
    std::string word;
    std::string current;
    auto flush = [&]() {
        TextLine line = style;
        line.text = current;
        lines.push_back(line);
        current.clear();
    };

    while (words >> word) {
        while (word.size() > maxChars) {
            if (!current.empty()) flush();
            current = word.substr(0, maxChars);
            flush();
            word.erase(0, maxChars);
        }
        if (!current.empty() && current.size() + 1 + word.size() > maxChars) {
            flush();
        }
        if (!current.empty()) current.push_back(' ');
        current += word;
    }
    if (!current.empty()) flush();
}

std::vector<TextLine> LayoutMarkdown(const std::string& markdown) {
    std::vector<TextLine> lines;
    std::istringstream input(markdown);
    std::string raw;
    while (std::getline(input, raw)) {
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        std::string text = ToLatin1(raw);

        TextLine style;
        if (text.rfind("### ", 0) == 0) {
            style = {"", true, 12.0, 18.0};
            text.erase(0, 4);
        } else if (text.rfind("## ", 0) == 0) {
            style = {"", true, 14.0, 20.0};
            text.erase(0, 3);
        } else if (text.rfind("# ", 0) == 0) {
            style = {"", true, 16.0, 22.0};
            text.erase(0, 2);
        }

        text = StripInlineMarkup(text);
        if (text.find_first_not_of(" \t") == std::string::npos) {
            lines.push_back({"", false, kBodySize, 8.0});
            continue;
        }
        WrapInto(text, style, lines);
    }
    return lines;
}

std::vector<std::string> Paginate(const std::vector<TextLine>& lines) {
    std::vector<std::string> pages;
    std::ostringstream content;
    double y = kPageHeight - kMargin;
    bool pageHasText = false;

    auto newPage = [&]() {
        pages.push_back(content.str());
        content.str("");
        content.clear();
        y = kPageHeight - kMargin;
        pageHasText = false;
    };

    char buffer[64];
    for (const auto& line : lines) {
        if (y - line.leading < kMargin && pageHasText) {
            newPage();
        }
        y -= line.leading;
        if (line.text.empty()) continue;

        std::snprintf(buffer, sizeof(buffer), "%.2f %.2f", kMargin, y);
        content << "BT /" << (line.bold ? "F2" : "F1") << " " << line.size << " Tf "
                << buffer << " Td (" << EscapePdfString(line.text) << ") Tj ET\n";
        pageHasText = true;
    }
    pages.push_back(content.str());
    return pages;
}

} // namespace

std::string PdfWriter::RenderMarkdown(const std::string& markdown) {
    std::vector<std::string> pageStreams = Paginate(LayoutMarkdown(markdown));

    // 1 catalog, 2 pages, 3-4 fonts, then a (page, contents) pair per page.
    std::vector<std::string> objects;
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");

    std::ostringstream kids;
    for (std::size_t i = 0; i < pageStreams.size(); ++i) {
        kids << (i ? " " : "") << (5 + 2 * i) << " 0 R";
    }
    objects.push_back("<< /Type /Pages /Kids [" + kids.str() + "] /Count " + std::to_string(pageStreams.size()) + " >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>");

    for (std::size_t i = 0; i < pageStreams.size(); ++i) {
        std::size_t contentsId = 6 + 2 * i;
        objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 595 842] "
                          "/Resources << /Font << /F1 3 0 R /F2 4 0 R >> >> /Contents " +
                          std::to_string(contentsId) + " 0 R >>");
        const std::string& stream = pageStreams[i];
        objects.push_back("<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream + "\nendstream");
    }

    std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<std::size_t> offsets;
    for (std::size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(out.size());
        out += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }

    std::size_t xrefOffset = out.size();
    out += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
    out += "0000000000 65535 f \n";
    char entry[32];
    for (std::size_t offset : offsets) {
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
        out += entry;
    }
    out += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
    out += "startxref\n" + std::to_string(xrefOffset) + "\n%%EOF\n";
    return out;
}

} // namespace docgen::infrastructure
