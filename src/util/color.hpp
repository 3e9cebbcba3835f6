#pragma once

#include <cstdint>
#include <string>

namespace revdiff {

// 16 color palette. `r` and `g` hold the SGR codes for foreground and
// background respectively.
struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        DefaultColor,
        Ignore,
        Reset
    };

    Kind kind;

    uint8_t r;
    uint8_t g;

    TermColor() {
        *this = TermColor::kDefault;
    }

    TermColor(Kind kind, uint8_t r, uint8_t g)
        : kind(kind)
        , r(r)
        , g(g) {}

    bool operator == (const TermColor& other) const {
        return other.kind == kind && other.r == r && other.g == g;
    }

    static TermColor kNone;
    static TermColor kReset;
    static TermColor kDefault;

    static TermColor kRed;
    static TermColor kGreen;
    static TermColor kYellow;
    static TermColor kCyan;
    static TermColor kDarkGray;
};

struct TermStyle {

    enum class Attribute : uint16_t {
        None          = 0,
        Bold          = 1 << 0,
        Dim           = 1 << 1,
        Italic        = 1 << 2,
        Underline     = 1 << 4,
        Inverse       = 1 << 6,
    };

    TermColor fg;
    TermColor bg;
    Attribute attr;

    TermStyle()
    : TermStyle(TermColor::kNone, TermColor::kNone) {}

    explicit TermStyle(TermColor fg, TermColor bg, Attribute attr)
        : fg(fg)
        , bg(bg)
        , attr(attr) {}

    explicit TermStyle(TermColor fg, TermColor bg)
        : TermStyle(fg, bg, Attribute::None) {}

    // ANSI escape sequence selecting this style; empty when nothing is set.
    std::string
    to_ansi() const;
};

// Styles used when rendering rows to a color capable terminal.
struct RowTextStyle {
    // clang-format off
    TermStyle header      = TermStyle { TermColor::kCyan,     TermColor::kNone, TermStyle::Attribute::None };
    TermStyle delete_line = TermStyle { TermColor::kRed,      TermColor::kNone, TermStyle::Attribute::None };
    TermStyle insert_line = TermStyle { TermColor::kGreen,    TermColor::kNone, TermStyle::Attribute::None };
    TermStyle changed     = TermStyle { TermColor::kNone,     TermColor::kNone, TermStyle::Attribute::Inverse };
    TermStyle comment     = TermStyle { TermColor::kYellow,   TermColor::kNone, TermStyle::Attribute::None };
    TermStyle folded      = TermStyle { TermColor::kDarkGray, TermColor::kNone, TermStyle::Attribute::Italic };
    TermStyle reset       = TermStyle { TermColor::kReset,    TermColor::kNone, TermStyle::Attribute::None };
    // clang-format on
};

}  // namespace revdiff
