#include "model/diff.hpp"

revdiff::LineNumber
revdiff::canonical_line_number(const DiffLine& line) {
    switch (line.kind) {
        case LineKind::Add:
        case LineKind::Context:
            return line.new_line_number;
        case LineKind::Del:
            return line.old_line_number;
        case LineKind::Header:
            break;
    }
    return std::nullopt;
}

const char*
revdiff::to_string(LineKind kind) {
    switch (kind) {
        case LineKind::Header:
            return "header";
        case LineKind::Context:
            return "context";
        case LineKind::Add:
            return "add";
        case LineKind::Del:
            return "del";
    }
    return "unknown";
}

const char*
revdiff::patch_prefix(LineKind kind) {
    switch (kind) {
        case LineKind::Context:
            return " ";
        case LineKind::Add:
            return "+";
        case LineKind::Del:
            return "-";
        case LineKind::Header:
            break;
    }
    return "";
}
