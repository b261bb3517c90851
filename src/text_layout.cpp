//
//  text_layout.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "text_layout.hpp"

#include <cwchar>
#include <vector>

namespace taglens {

namespace {

constexpr const char *kEllipsis = "...";
constexpr size_t kEllipsisLen = 3;

struct Glyph {
    size_t offset;  ///< byte offset into the source string
    size_t bytes;
    size_t width;   ///< columns; 0 for combining marks
};

size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

size_t code_point_width(char32_t cp) {
    if (cp < 0x80) {
        return 1;
    }
    // Outside a UTF-8 locale wcwidth rejects non-ASCII; those count as one column.
    int w = ::wcwidth(static_cast<wchar_t>(cp));
    return w < 0 ? 1 : static_cast<size_t>(w);
}

std::vector<Glyph> split_glyphs(const std::string &text) {
    std::vector<Glyph> glyphs;
    glyphs.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t len = sequence_length(lead);
        bool valid = len > 0 && i + len <= text.size();
        char32_t cp = len == 1 ? lead : lead & (0x7F >> len);
        for (size_t k = 1; valid && k < len; ++k) {
            const auto c = static_cast<unsigned char>(text[i + k]);
            if ((c & 0xC0) != 0x80) {
                valid = false;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (!valid) {
            glyphs.push_back({i, 1, 1});
            ++i;
            continue;
        }
        glyphs.push_back({i, len, code_point_width(cp)});
        i += len;
    }
    return glyphs;
}

// Drops the leading characters that start within the first `columns` columns.
std::string skip_columns(const std::string &text, size_t columns) {
    size_t col = 0;
    for (const auto &g : split_glyphs(text)) {
        if (col >= columns) {
            return text.substr(g.offset);
        }
        col += g.width;
    }
    return {};
}

}  // namespace

size_t display_width(const std::string &text) {
    size_t width = 0;
    for (const auto &g : split_glyphs(text)) {
        width += g.width;
    }
    return width;
}

std::string fit_columns(const std::string &text, size_t width) {
    size_t col = 0;
    for (const auto &g : split_glyphs(text)) {
        if (col + g.width > width) {
            return text.substr(0, g.offset);
        }
        col += g.width;
    }
    return text;
}

std::string pad_cell(std::string text, size_t width) {
    const size_t used = display_width(text);
    if (used < width) {
        text.append(width - used, ' ');
    }
    return text;
}

std::string clip_cell(const std::string &text, size_t width, size_t x_offset) {
    if (width == 0) {
        return {};
    }
    std::string out;
    if (x_offset > 0) {
        if (width <= kEllipsisLen) {
            return std::string(width, '.');
        }
        out = kEllipsis;
        out += skip_columns(text, x_offset + kEllipsisLen);
    } else {
        out = text;
    }
    if (display_width(out) > width) {
        if (width <= kEllipsisLen) {
            return fit_columns(out, width);
        }
        out = fit_columns(out, width - kEllipsisLen);
        out += kEllipsis;
    }
    return out;
}

std::string clip_path_left(const std::string &path, size_t width) {
    if (display_width(path) <= width) {
        return path;
    }
    const size_t keep = width <= kEllipsisLen ? width : width - kEllipsisLen;
    const auto glyphs = split_glyphs(path);
    size_t col = 0;
    size_t start = path.size();
    for (auto it = glyphs.rbegin(); it != glyphs.rend(); ++it) {
        if (col + it->width > keep) {
            break;
        }
        col += it->width;
        start = it->offset;
    }
    std::string tail = path.substr(start);
    return width <= kEllipsisLen ? tail : kEllipsis + tail;
}

}  // namespace taglens
