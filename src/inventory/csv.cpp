#include "invlens/inventory/csv.h"

namespace invlens::inventory {

bool ParseCsvLine(const std::string& line, std::vector<std::string>* fields) {
    fields->clear();
    std::string field;
    size_t i = 0;
    const size_t n = line.size();

    while (true) {
        field.clear();
        if (i < n && line[i] == '"') {
            ++i;
            bool closed = false;
            while (i < n) {
                if (line[i] == '"') {
                    if (i + 1 < n && line[i + 1] == '"') {
                        field.push_back('"');
                        i += 2;
                        continue;
                    }
                    closed = true;
                    ++i;
                    break;
                }
                field.push_back(line[i++]);
            }
            if (!closed) {
                return false;
            }
            if (i < n && line[i] != ',') {
                return false;
            }
        } else {
            while (i < n && line[i] != ',') {
                field.push_back(line[i++]);
            }
        }

        fields->push_back(field);
        if (i >= n) {
            break;
        }
        ++i;  // ','
    }
    return true;
}

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool UrlDecode(const std::string& in, std::string* out) {
    out->clear();
    out->reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out->push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= in.size()) {
                return false;
            }
            int hi = HexValue(in[i + 1]);
            int lo = HexValue(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out->push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out->push_back(c);
        }
    }
    return true;
}

} // namespace invlens::inventory
