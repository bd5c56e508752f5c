#include "dataset_store.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "timestamp.hpp"

namespace harvester {

namespace {

const char* const CSV_HEADER = "Timestamp,Type,Value,Source URL";

// Reads one logical record; quoted fields may span physical lines.
bool read_record(std::istream& in, std::string& record) {
    record.clear();
    std::string line;
    bool in_quotes = false;
    bool any = false;
    while (std::getline(in, line)) {
        any = true;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!record.empty() || in_quotes) {
            record.push_back('\n');
        }
        record += line;
        for (char c : line) {
            if (c == '"') {
                in_quotes = !in_quotes;
            }
        }
        if (!in_quotes) {
            return true;
        }
    }
    if (any && in_quotes) {
        throw PersistenceError("unterminated quoted field");
    }
    return any;
}

} // namespace

std::vector<std::string> parse_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool quoted_field = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            if (!field.empty() || quoted_field) {
                throw PersistenceError("unexpected quote in field: " + line);
            }
            in_quotes = true;
            quoted_field = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
            quoted_field = false;
        } else {
            if (quoted_field) {
                throw PersistenceError("text after closing quote: " + line);
            }
            field.push_back(c);
        }
    }
    if (in_quotes) {
        throw PersistenceError("unterminated quoted field: " + line);
    }
    fields.push_back(std::move(field));
    return fields;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::optional<Dataset> CsvDatasetStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw PersistenceError("cannot stat " + path + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PersistenceError("cannot open " + path);
    }

    std::string record;
    if (!read_record(in, record)) {
        // An empty file holds an empty dataset.
        return Dataset();
    }
    if (!record.empty() && record.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        record.erase(0, 3);
    }
    if (record != CSV_HEADER) {
        throw PersistenceError(path + ": unexpected header '" + record + "'");
    }

    Dataset dataset;
    size_t line_no = 1;
    while (read_record(in, record)) {
        ++line_no;
        if (record.empty()) {
            continue;
        }
        std::vector<std::string> fields = parse_csv_line(record);
        if (fields.size() != 4) {
            throw PersistenceError(path + ":" + std::to_string(line_no) + ": expected 4 fields, got " +
                                   std::to_string(fields.size()));
        }

        auto ts = parse_timestamp(fields[0]);
        if (!ts) {
            throw PersistenceError(path + ":" + std::to_string(line_no) + ": bad timestamp '" +
                                   fields[0] + "'");
        }
        auto type = parse_contact_type(fields[1]);
        if (!type) {
            throw PersistenceError(path + ":" + std::to_string(line_no) + ": unknown type '" +
                                   fields[1] + "'");
        }
        dataset.push_back(ContactRecord{*ts, *type, fields[2], fields[3]});
    }
    if (in.bad()) {
        throw PersistenceError("read error on " + path);
    }
    return dataset;
}

void CsvDatasetStore::save(const Dataset& dataset) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PersistenceError("cannot open " + tmp_path + " for writing");
        }
        out << CSV_HEADER << "\n";
        for (const ContactRecord& record : dataset) {
            out << format_timestamp(record.timestamp) << ',' << contact_type_name(record.type)
                << ',' << csv_escape(record.value) << ',' << csv_escape(record.source_url) << "\n";
        }
        out.flush();
        if (!out) {
            throw PersistenceError("write error on " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw PersistenceError("cannot replace " + path + ": " + reason);
    }
}

} // namespace harvester
