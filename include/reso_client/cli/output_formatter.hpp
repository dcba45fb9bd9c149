#pragma once

#include <reso_client/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace reso_client {

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for CLI commands.
//
// Three modes: plain text tables, FTXUI tables with ANSI colors (color_mode
// without json_mode), and JSON. Results go to `out`, errors to `err`.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Print a table. In JSON mode, a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Print "key: value" lines under a title. In JSON mode, one object.
    void PrintFields(const std::string& title,
                     const std::vector<std::pair<std::string, std::string>>& fields) const;

    // Print a JSON document, pretty in human modes and compact in JSON mode.
    void PrintJson(const nlohmann::json& doc) const;

    // Print raw text unchanged (e.g. an EDMX document).
    void PrintRaw(const std::string& text) const;

    // Print an error to the error stream.
    void PrintError(const Error& error) const;

    // Print a success message (human mode) or {"success":true,...} (JSON mode).
    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

// Render a JSON value as a table cell: strings unquoted, null empty,
// everything else compact JSON.
std::string CellText(const nlohmann::json& value);

// Turn OData records into table rows. With no columns, the columns are the
// keys of the records in first-seen order, skipping "@odata." annotations.
std::vector<std::string> RecordColumns(const std::vector<nlohmann::json>& records,
                                       const std::vector<std::string>& columns);
std::vector<std::vector<std::string>> RecordRows(const std::vector<nlohmann::json>& records,
                                                 const std::vector<std::string>& columns);

} // namespace reso_client
