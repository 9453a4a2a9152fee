/// @file src/core/element_loader.cpp
/// @brief CSV ElementLoader for batches of design inputs.

#include "rcde/element_loader.hpp"
#include "rcde/logging.hpp"

#include <cmath>
#include <fstream>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rcde::core {

namespace {

constexpr std::size_t REQUIRED_FIELDS = 10;
constexpr std::size_t MAX_FIELDS      = 13;

std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

/// Parse a finite number; the whole token must be consumed.
std::optional<double> parse_number(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const double val = std::stod(token, &pos);
        if (pos != token.size() || !std::isfinite(val)) {
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // anonymous namespace

// ─── ElementLoader::parse_row ─────────────────────────────────────────────────

std::optional<DesignInput> ElementLoader::parse_row(const std::string& line) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    try {
        std::istringstream ss(line);
        std::string token;
        std::vector<std::string> fields;
        fields.reserve(MAX_FIELDS);
        while (std::getline(ss, token, ',')) {
            fields.push_back(trim(token));
        }
        // A trailing comma leaves an empty last field.
        if (!line.empty() && line.back() == ',') {
            fields.emplace_back();
        }
        if (fields.size() < REQUIRED_FIELDS || fields.size() > MAX_FIELDS) {
            return std::nullopt;
        }

        const auto kind = parse_element_kind(fields[0]);
        if (!kind) {
            return std::nullopt;
        }

        double numbers[REQUIRED_FIELDS] = {};
        for (std::size_t i = 1; i < REQUIRED_FIELDS; ++i) {
            if (i == 3 && fields[i].empty()) {
                continue;  // span is optional
            }
            const auto val = parse_number(fields[i]);
            if (!val) {
                return std::nullopt;
            }
            numbers[i] = *val;
        }

        Constraints constraints{};
        if (fields.size() > 10 && !fields[10].empty()) {
            constraints.deflection_limit = parse_number(fields[10]);
            if (!constraints.deflection_limit) return std::nullopt;
        }
        if (fields.size() > 11 && !fields[11].empty()) {
            constraints.crack_width_limit = parse_number(fields[11]);
            if (!constraints.crack_width_limit) return std::nullopt;
        }
        if (fields.size() > 12 && !fields[12].empty()) {
            constraints.exposure = parse_exposure(fields[12]);
            if (!constraints.exposure) return std::nullopt;
        }

        return DesignInput{
            .kind     = *kind,
            .geometry = Geometry{
                .width       = numbers[1],
                .height      = numbers[2],
                .span        = fields[3].empty() ? std::nullopt
                                                 : std::optional<double>(numbers[3]),
                .clear_cover = numbers[4],
            },
            .material = Material{.fc = numbers[5], .fy = numbers[6]},
            .loads    = Loads{},
            .forces   = Forces{
                .moment_x = numbers[7],
                .shear    = numbers[8],
                .axial    = numbers[9],
            },
            .constraints = constraints,
        };
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── ElementLoader::parse_csv_string ─────────────────────────────────────────

std::vector<DesignInput>
ElementLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<DesignInput> inputs;
    try {
        std::istringstream stream(csv_content);
        std::string line;
        bool header_skipped = false;
        std::size_t line_no = 0;

        while (std::getline(stream, line)) {
            ++line_no;
            // Trim carriage return.
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            if (!header_skipped) {
                // First non-empty, non-comment line is the header.
                if (!line.empty() && line[0] != '#') {
                    header_skipped = true;
                }
                continue;
            }
            if (trim(line).empty() || line[0] == '#') {
                continue;
            }

            auto input = parse_row(line);
            if (input) {
                inputs.push_back(*input);
            } else {
                log::logger().warn("loader: skipping malformed row {}: '{}'", line_no, line);
            }
        }
    } catch (const std::bad_alloc&) {
        log::logger().error("loader: out of memory after {} rows", inputs.size());
    }
    return inputs;
}

// ─── ElementLoader::load_csv ─────────────────────────────────────────────────

std::optional<std::vector<DesignInput>>
ElementLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace rcde::core
