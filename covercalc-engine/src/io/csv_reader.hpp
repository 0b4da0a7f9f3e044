#ifndef COVERCALC_CSV_READER_HPP
#define COVERCALC_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace covercalc {

// Line-oriented CSV reader. Cells are trimmed; quoted cells may contain the
// delimiter and doubled quotes but not line breaks.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // Split one line into trimmed cells
    static std::vector<std::string> split_line(const std::string& line, char delimiter);

private:
    std::istream& is_;
    char delimiter_;

    static std::string trim(const std::string& s);
};

} // namespace covercalc

#endif // COVERCALC_CSV_READER_HPP
