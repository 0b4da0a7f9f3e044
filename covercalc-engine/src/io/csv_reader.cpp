#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>

namespace covercalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

std::vector<std::string> CsvReader::read_row() {
    std::string line;
    if (!std::getline(is_, line)) {
        return {};
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return split_line(line, delimiter_);
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

std::vector<std::string> CsvReader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> row;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == delimiter) {
            row.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    row.push_back(trim(cell));
    return row;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace covercalc
