#pragma once

/// @file include/rcde/element_loader.hpp
/// @brief CSV loader for batches of element design inputs.
///
/// # Module: ElementLoader
///
/// ## Responsibility
/// Parse CSV files describing structural elements into `DesignInput` values
/// for the `rcde --design` command. Malformed rows are skipped with a
/// warning; the loader never crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// kind,width,height,span,cover,fc,fy,moment,shear,axial[,deflection_limit,crack_width,exposure]
/// beam,300,500,6000,40,30,400,180,120,0
/// column,400,400,,40,30,400,120,40,1500
/// slab,1000,150,4000,20,25,400,20,30,0,,,severe
/// ```
/// The first line is treated as a header and skipped. `span` and the three
/// optional constraint columns may be left empty.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load
/// - Rows are only parsed here; preconditions are checked by `DesignEngine`

#include "rcde/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rcde::core {

class ElementLoader {
public:
    /// Load element inputs from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    /// - Vector of parsed inputs, skipping malformed rows
    [[nodiscard]] static std::optional<std::vector<DesignInput>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse element inputs from a CSV-formatted string.
    [[nodiscard]] static std::vector<DesignInput>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse one data row; `nullopt` if it is malformed.
    [[nodiscard]] static std::optional<DesignInput>
    parse_row(const std::string& line) noexcept;
};

}  // namespace rcde::core
