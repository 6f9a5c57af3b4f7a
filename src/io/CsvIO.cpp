#include "io/CsvIO.hpp"
#include "orders/TextUtil.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace smartcart {

int CsvTable::column(const std::string& name) const {
    const std::string want = textutil::lookup_key(name);
    for (size_t i = 0; i < header.size(); ++i) {
        if (textutil::lookup_key(header[i]) == want) return static_cast<int>(i);
    }
    return -1;
}

// Reads one record. Returns false at EOF with nothing read.
static bool read_record(std::istream& in, std::vector<std::string>& fields) {
    fields.clear();

    std::string cur;
    bool in_quotes = false;
    bool any = false;
    char c;

    while (in.get(c)) {
        any = true;
        if (in_quotes) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get(c);
                    cur.push_back('"');
                } else {
                    in_quotes = false;
                }
            } else {
                cur.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(cur));
            cur.clear();
        } else if (c == '\r') {
            if (in.peek() == '\n') in.get(c);
            break;
        } else if (c == '\n') {
            break;
        } else {
            cur.push_back(c);
        }
    }

    if (!any) return false;
    fields.push_back(std::move(cur));
    return true;
}

static bool is_blank_record(const std::vector<std::string>& fields) {
    return fields.size() == 1 && textutil::trim(fields[0]).empty();
}

CsvTable read_csv(std::istream& in) {
    CsvTable t;
    std::vector<std::string> fields;

    while (read_record(in, fields)) {
        if (is_blank_record(fields)) continue;
        if (t.header.empty()) {
            // strip a UTF-8 BOM from the first header cell
            if (fields[0].size() >= 3 && fields[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
                fields[0] = fields[0].substr(3);
            }
            for (auto& h : fields) h = textutil::trim(h);
            t.header = fields;
            continue;
        }
        if (fields.size() < t.header.size()) fields.resize(t.header.size());
        t.rows.push_back(fields);
    }

    return t;
}

CsvTable read_csv_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open CSV file: " + path.string());

    CsvTable t = read_csv(in);
    if (t.header.empty()) throw std::runtime_error("CSV file has no header row: " + path.string());
    return t;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void write_csv_row(std::ostream& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) out << ',';
        out << csv_escape(fields[i]);
    }
    out << '\n';
}

}  // namespace smartcart
