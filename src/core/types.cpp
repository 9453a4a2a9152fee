/// @file src/core/types.cpp
/// @brief Enum labels, parsers and CheckResult helpers for rcde/types.hpp.

#include "rcde/types.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <new>
#include <string>

namespace rcde {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

}  // anonymous namespace

// ─── Labels ───────────────────────────────────────────────────────────────────

std::string_view to_string(ElementKind kind) noexcept {
    switch (kind) {
        case ElementKind::Beam:   return "beam";
        case ElementKind::Column: return "column";
        case ElementKind::Slab:   return "slab";
    }
    return "unknown";
}

std::string_view to_string(ExposureClass exposure) noexcept {
    switch (exposure) {
        case ExposureClass::Mild:       return "mild";
        case ExposureClass::Moderate:   return "moderate";
        case ExposureClass::Severe:     return "severe";
        case ExposureClass::VerySevere: return "very_severe";
        case ExposureClass::Extreme:    return "extreme";
    }
    return "unknown";
}

std::string_view to_string(CheckStatus status) noexcept {
    return status == CheckStatus::Pass ? "pass" : "fail";
}

std::string_view to_string(BarLayout layout) noexcept {
    switch (layout) {
        case BarLayout::SingleRow: return "single_row";
        case BarLayout::DoubleRow: return "double_row";
        case BarLayout::MultiRow:  return "multiple_rows";
    }
    return "unknown";
}

// ─── Parsers ──────────────────────────────────────────────────────────────────

std::optional<ElementKind> parse_element_kind(std::string_view text) noexcept {
    try {
        const std::string key = lowercase(text);
        if (key == "beam")   return ElementKind::Beam;
        if (key == "column") return ElementKind::Column;
        if (key == "slab")   return ElementKind::Slab;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<ExposureClass> parse_exposure(std::string_view text) noexcept {
    try {
        std::string key = lowercase(text);
        std::replace(key.begin(), key.end(), '-', '_');
        if (key == "mild")        return ExposureClass::Mild;
        if (key == "moderate")    return ExposureClass::Moderate;
        if (key == "severe")      return ExposureClass::Severe;
        if (key == "very_severe") return ExposureClass::VerySevere;
        if (key == "extreme")     return ExposureClass::Extreme;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
    return std::nullopt;
}

// ─── CheckResult ──────────────────────────────────────────────────────────────

CheckResult CheckResult::capacity(double required, double provided, bool extra_ok) noexcept {
    const double ratio = required > 0.0
        ? provided / required
        : std::numeric_limits<double>::infinity();
    const bool ok = provided >= required && extra_ok;
    return CheckResult{
        .required   = required,
        .provided   = provided,
        .ratio      = ratio,
        .status     = ok ? CheckStatus::Pass : CheckStatus::Fail,
        .applicable = true,
    };
}

CheckResult CheckResult::not_applicable() noexcept {
    return CheckResult{
        .required   = 0.0,
        .provided   = 0.0,
        .ratio      = 1.0,
        .status     = CheckStatus::Pass,
        .applicable = false,
    };
}

// ─── BarLayout ────────────────────────────────────────────────────────────────

BarLayout layout_for_count(int count) noexcept {
    if (count <= 4) return BarLayout::SingleRow;
    if (count <= 8) return BarLayout::DoubleRow;
    return BarLayout::MultiRow;
}

}  // namespace rcde
