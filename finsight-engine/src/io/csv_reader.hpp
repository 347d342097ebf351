#ifndef FINSIGHT_CSV_READER_HPP
#define FINSIGHT_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace finsight {

// Splits delimited text into trimmed cells. A cell wrapped in double quotes
// may contain the delimiter; "" inside a quoted cell is a literal quote.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based line number of the last row returned by read_row()
    size_t line_number() const { return line_number_; }

    static std::string trim(const std::string& s);

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
};

} // namespace finsight

#endif // FINSIGHT_CSV_READER_HPP
