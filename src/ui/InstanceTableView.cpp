/**
 * @file InstanceTableView.cpp
 * @brief Implementation of InstanceTableView.
 */

#include "ui/InstanceTableView.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace odsmanager::ui {

namespace {

std::string Row(const std::vector<std::string>& cells, const std::vector<std::size_t>& widths) {
    std::ostringstream out;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i) out << "  ";
        out << std::left << std::setw(static_cast<int>(widths[i])) << cells[i];
    }
    std::string line = out.str();
    line.erase(line.find_last_not_of(' ') + 1);
    return line;
}

} // namespace

std::string InstanceTableView::Render(const domain::OdsInstance& instance,
                                      const std::vector<std::string>& order,
                                      std::size_t numberPerBlock) {
    if (instance.empty()) return "";
    if (numberPerBlock == 0) numberPerBlock = 1;

    const auto& standard = instance.standard();
    std::vector<std::string> fields;
    for (const auto& field : order) {
        if (standard.isField(field)) fields.push_back(field);
    }
    for (const auto& field : standard.fieldNames()) {
        if (std::find(fields.begin(), fields.end(), field) == fields.end()) fields.push_back(field);
    }

    std::ostringstream out;
    for (std::size_t first = 0; first < instance.size(); first += numberPerBlock) {
        const std::size_t last = std::min(first + numberPerBlock, instance.size());

        std::vector<std::vector<std::string>> table;
        std::vector<std::string> header{"Field    \\    #"};
        for (std::size_t i = first; i < last; ++i) header.push_back(std::to_string(i));
        table.push_back(header);
        for (const auto& field : fields) {
            std::vector<std::string> row{field};
            for (std::size_t i = first; i < last; ++i) {
                row.push_back(domain::ToString(instance.records()[i].get(field)));
            }
            table.push_back(std::move(row));
        }

        std::vector<std::size_t> widths(header.size(), 0);
        for (const auto& row : table) {
            for (std::size_t c = 0; c < row.size(); ++c) widths[c] = std::max(widths[c], row[c].size());
        }

        std::vector<std::string> rule;
        for (auto width : widths) rule.emplace_back(width, '-');
        const std::string ruleLine = Row(rule, widths);

        out << Row(table.front(), widths) << "\n" << ruleLine << "\n";
        for (std::size_t r = 1; r < table.size(); ++r) out << Row(table[r], widths) << "\n";
        out << std::string(ruleLine.size(), '=') << "\n";
    }
    return out.str();
}

std::string InstanceTableView::RenderFieldMap(const domain::FieldMap& fields) {
    std::ostringstream out;
    for (const auto& [key, value] : fields) {
        out << "    " << std::left << std::setw(26) << key << "  " << domain::ToString(value) << "\n";
    }
    return out.str();
}

} // namespace odsmanager::ui
