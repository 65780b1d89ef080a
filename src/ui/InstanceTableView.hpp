/**
 * @file InstanceTableView.hpp
 * @brief Console rendering of an ODS instance as blocks of columns.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/OdsInstance.hpp"

namespace odsmanager::ui {

/**
 * @class InstanceTableView
 * @brief Transposed table: one row per field, one column per record, numberPerBlock records per block.
 */
class InstanceTableView {
public:
    /**
     * @param order Fields shown first; the remaining schema fields follow in schema order.
     * @return Empty string for an empty instance.
     */
    static std::string Render(const domain::OdsInstance& instance,
                              const std::vector<std::string>& order = {"src_id", "src_start_utc", "src_end_utc"},
                              std::size_t numberPerBlock = 5);

    /** @brief One "field: value" line per entry, aligned on the key column. */
    static std::string RenderFieldMap(const domain::FieldMap& fields);
};

} // namespace odsmanager::ui
