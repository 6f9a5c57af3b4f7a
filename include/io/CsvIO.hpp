#pragma once
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace smartcart {

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;  // every row padded to header size

    // case-insensitive header lookup, -1 if absent
    int column(const std::string& name) const;
};

// Comma-separated, double-quoted fields with "" escapes and embedded
// newlines. First record is the header. An unterminated quote at EOF
// closes the field.
CsvTable read_csv(std::istream& in);
CsvTable read_csv_file(const std::filesystem::path& path);

std::string csv_escape(const std::string& field);
void write_csv_row(std::ostream& out, const std::vector<std::string>& fields);

}  // namespace smartcart
