#include "util/color.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <tuple>
#include <vector>

using namespace revdiff;

// clang-format off
const std::array<std::tuple<const TermStyle::Attribute, int>, 5> kAttributes {{
    { TermStyle::Attribute::Bold,      1 },
    { TermStyle::Attribute::Dim,       2 },
    { TermStyle::Attribute::Italic,    3 },
    { TermStyle::Attribute::Underline, 4 },
    { TermStyle::Attribute::Inverse,   7 },
}};

TermColor TermColor::kNone    = TermColor { TermColor::Kind::Ignore, 0, 0 };
TermColor TermColor::kReset   = TermColor { TermColor::Kind::Reset, 0, 0 };
TermColor TermColor::kDefault = TermColor { TermColor::Kind::DefaultColor, 39, 49 };

TermColor TermColor::kRed      = TermColor { TermColor::Kind::Color4bit, 31,  41 };
TermColor TermColor::kGreen    = TermColor { TermColor::Kind::Color4bit, 32,  42 };
TermColor TermColor::kYellow   = TermColor { TermColor::Kind::Color4bit, 33,  43 };
TermColor TermColor::kCyan     = TermColor { TermColor::Kind::Color4bit, 36,  46 };
TermColor TermColor::kDarkGray = TermColor { TermColor::Kind::Color4bit, 90, 100 };
// clang-format on

std::string
TermStyle::to_ansi() const {
    std::vector<int> escseq;

    auto apply_color = [&](const TermColor& color, bool is_fg) {
        switch (color.kind) {
            // ESC[{ID};{ID}m  Set foreground and background color
            case TermColor::Kind::DefaultColor:
            case TermColor::Kind::Color4bit:
                escseq.push_back(is_fg ? color.r : color.g);
                break;
            case TermColor::Kind::Reset:
                escseq.push_back(0);
                break;
            case TermColor::Kind::Ignore:
                break;
        }
    };

    apply_color(fg, true);
    for (const auto& [attr_flag, attr_code] : kAttributes) {
        if (static_cast<uint16_t>(attr) & static_cast<uint16_t>(attr_flag)) {
            escseq.push_back(attr_code);
        }
    }
    apply_color(bg, false);

    if (escseq.empty()) {
        return {};
    }
    return fmt::format("\033[{}m", fmt::join(escseq, ";"));
}
