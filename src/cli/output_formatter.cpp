#include <reso_client/cli/output_formatter.hpp>
#include <reso_client/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace reso_client {

namespace {

using namespace reso_client::ansi;

bool IsAnnotation(const std::string& key) {
    return key.find("@odata.") != std::string::npos;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Record helpers
// ---------------------------------------------------------------------------
std::string CellText(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> RecordColumns(const std::vector<nlohmann::json>& records,
                                       const std::vector<std::string>& columns) {
    if (!columns.empty()) return columns;

    std::vector<std::string> found;
    for (const auto& record : records) {
        if (!record.is_object()) continue;
        for (const auto& item : record.items()) {
            if (IsAnnotation(item.key())) continue;
            if (std::find(found.begin(), found.end(), item.key()) == found.end()) {
                found.push_back(item.key());
            }
        }
    }
    return found;
}

std::vector<std::vector<std::string>> RecordRows(const std::vector<nlohmann::json>& records,
                                                 const std::vector<std::string>& columns) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        std::vector<std::string> row;
        row.reserve(columns.size());
        for (const auto& column : columns) {
            if (record.is_object()) {
                auto it = record.find(column);
                row.push_back(it != record.end() ? CellText(*it) : "");
            } else {
                row.emplace_back();
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

// ---------------------------------------------------------------------------
// OutputFormatter
// ---------------------------------------------------------------------------
void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << array.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintFields(
    const std::string& title,
    const std::vector<std::pair<std::string, std::string>>& fields) const {

    if (json_mode_) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& [key, value] : fields) {
            obj[key] = value;
        }
        out_ << obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return;
    }

    size_t key_width = 0;
    for (const auto& field : fields) {
        key_width = std::max(key_width, field.first.size());
    }

    if (color_mode_) {
        out_ << kBold << title << kReset << "\n";
    } else {
        out_ << title << "\n";
    }
    for (const auto& [key, value] : fields) {
        out_ << "  ";
        if (color_mode_) out_ << kDim;
        out_ << std::left << std::setw(static_cast<int>(key_width)) << key;
        if (color_mode_) out_ << kReset;
        out_ << "  " << value << "\n";
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& doc) const {
    const int indent = json_mode_ ? -1 : 2;
    out_ << doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

void OutputFormatter::PrintRaw(const std::string& text) const {
    out_ << text;
    if (text.empty() || text.back() != '\n') {
        out_ << "\n";
    }
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << error.ToString() << "\n";
        if (!error.endpoint.empty()) {
            err_ << "  " << kDim << error.operation << " " << error.endpoint
                 << kReset << "\n";
        }
        return;
    }

    err_ << "Error: " << error.ToString() << "\n";
    if (!error.endpoint.empty()) {
        err_ << "  " << error.operation << " " << error.endpoint << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json obj{{"success", true}, {"message", message}};
        out_ << obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace reso_client
