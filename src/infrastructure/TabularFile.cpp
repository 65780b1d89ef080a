/**
 * @file TabularFile.cpp
 * @brief Implementation of TabularFile.
 */

#include "infrastructure/TabularFile.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace odsmanager::infrastructure {

namespace {

const std::string kWhitespace = "whitespace";

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool IsMissingCell(const std::string& cell) {
    return cell.empty() || cell == "None" || cell == "none" || cell == "nan" || cell == "NaN" || cell == "NULL";
}

std::string ReplaceAll(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) return text;
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

bool LoadHeaderMapFile(const std::string& path, std::map<std::string, std::string>& headerMap) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[TabularFile] Cannot open header map " << path << std::endl;
        return false;
    }
    try {
        nlohmann::json j;
        f >> j;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_string()) headerMap.emplace(it.key(), it.value().get<std::string>());
        }
    } catch (const std::exception& e) {
        std::cerr << "[TabularFile] Error reading header map " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

std::string Quoted(const std::string& cell, const std::string& separator) {
    const bool needsQuotes = cell.find(separator) != std::string::npos
        || cell.find('"') != std::string::npos
        || cell.find('\n') != std::string::npos;
    if (!needsQuotes) return cell;
    return "\"" + ReplaceAll(cell, "\"", "\"\"") + "\"";
}

} // namespace

std::string TabularFile::DetectSeparator(const std::string& headerLine) {
    if (headerLine.find(',') != std::string::npos) return ",";
    if (headerLine.find('\t') != std::string::npos) return "\t";
    return kWhitespace;
}

std::vector<std::string> TabularFile::SplitLine(const std::string& line, const std::string& separator) {
    std::vector<std::string> cells;
    if (separator == kWhitespace || separator.empty()) {
        std::istringstream iss(line);
        std::string cell;
        while (iss >> cell) cells.push_back(cell);
        return cells;
    }

    std::string current;
    bool inQuotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (inQuotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                inQuotes = false;
            } else {
                current += c;
            }
        } else if (c == '"' && Trim(current).empty()) {
            current.clear();
            inQuotes = true;
        } else if (line.compare(i, separator.size(), separator) == 0) {
            cells.push_back(Trim(current));
            current.clear();
            i += separator.size() - 1;
        } else {
            current += c;
        }
    }
    cells.push_back(Trim(current));
    return cells;
}

std::optional<std::vector<domain::FieldMap>> TabularFile::Parse(const std::string& text, const domain::TabularOptions& options) {
    std::map<std::string, std::string> headerMap = options.headerMap;
    if (!options.headerMapFile.empty() && !LoadHeaderMapFile(options.headerMapFile, headerMap)) {
        return std::nullopt;
    }

    std::istringstream input(text);
    std::string line;
    std::vector<std::string> header;
    std::string separator = options.separator;
    while (std::getline(input, line)) {
        if (Trim(line).empty()) continue;
        if (separator.empty() || separator == "auto") separator = DetectSeparator(line);
        for (auto name : SplitLine(line, separator)) {
            if (!options.replaceFrom.empty()) name = ReplaceAll(name, options.replaceFrom, options.replaceTo);
            auto mapped = headerMap.find(name);
            header.push_back(mapped == headerMap.end() ? name : mapped->second);
        }
        break;
    }
    if (header.empty()) {
        std::cerr << "[TabularFile] No header row found." << std::endl;
        return std::nullopt;
    }

    std::vector<domain::FieldMap> records;
    std::size_t lineNumber = 1;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (Trim(line).empty()) continue;
        auto cells = SplitLine(line, separator);
        if (cells.size() > header.size()) {
            std::cerr << "[TabularFile] Line " << lineNumber << " has " << cells.size() << " cells for "
                      << header.size() << " columns; extra cells ignored." << std::endl;
        }
        domain::FieldMap record;
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (i < cells.size() && !IsMissingCell(cells[i])) {
                record[header[i]] = cells[i];
            } else {
                record[header[i]] = std::monostate{};
            }
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::optional<std::vector<domain::FieldMap>> TabularFile::Read(const std::string& path, const domain::TabularOptions& options) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[TabularFile] Cannot open " << path << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str(), options);
}

std::string TabularFile::Format(const domain::OdsInstance& instance,
                                const std::vector<std::string>& columns,
                                const std::string& separator) {
    std::ostringstream out;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        out << (i ? separator : "") << Quoted(columns[i], separator);
    }
    out << "\n";
    for (const auto& record : instance.records()) {
        for (std::size_t i = 0; i < columns.size(); ++i) {
            out << (i ? separator : "") << Quoted(domain::ToString(record.get(columns[i])), separator);
        }
        out << "\n";
    }
    return out.str();
}

} // namespace odsmanager::infrastructure
