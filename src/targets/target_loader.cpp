#include "target_loader.hpp"

#include <cstdio>
#include <fstream>
#include <utility>

#include "../core/logger.hpp"

namespace beagle {
namespace {
constexpr size_t kFieldsPerRecord = 3;
constexpr char kPlaceholder = '$';

enum class ReadStatus { Record, End, Error };

class CsvReader {
   public:
    explicit CsvReader(std::istream& in) : in_(in) {}

    // record_line is the 1-based line on which the record starts.
    ReadStatus next(std::vector<std::string>& fields, size_t& record_line, std::string& err) {
        fields.clear();
        int c = in_.get();
        // skip blank lines
        while (c == '\n' || (c == '\r' && in_.peek() == '\n')) {
            if (c == '\r') in_.get();
            ++line_;
            c = in_.get();
        }
        if (c == EOF) return ReadStatus::End;
        record_line = line_;

        std::string field;
        while (true) {
            if (c == '"') {
                if (!read_quoted(field, err)) return ReadStatus::Error;
                c = in_.get();
                if (c == '\r' && in_.peek() == '\n') c = in_.get();
                if (c != ',' && c != '\n' && c != EOF) {
                    err = "line " + std::to_string(line_) +
                          ": extraneous or missing \" in quoted field";
                    return ReadStatus::Error;
                }
            } else {
                while (c != ',' && c != '\n' && c != EOF) {
                    if (c == '"') {
                        err = "line " + std::to_string(line_) + ": bare \" in non-quoted field";
                        return ReadStatus::Error;
                    }
                    field.push_back(static_cast<char>(c));
                    c = in_.get();
                }
                if (c != ',' && !field.empty() && field.back() == '\r') field.pop_back();
            }
            fields.push_back(std::move(field));
            field.clear();
            if (c == ',') {
                c = in_.get();
                continue;
            }
            if (c == '\n') ++line_;
            return ReadStatus::Record;
        }
    }

   private:
    // Called after the opening quote; consumes through the closing quote.
    bool read_quoted(std::string& field, std::string& err) {
        size_t start_line = line_;
        while (true) {
            int c = in_.get();
            if (c == EOF) {
                err = "line " + std::to_string(start_line) + ": unterminated quoted field";
                return false;
            }
            if (c == '"') {
                if (in_.peek() != '"') return true;
                in_.get();
            } else if (c == '\n') {
                ++line_;
            }
            field.push_back(static_cast<char>(c));
        }
    }

    std::istream& in_;
    size_t line_{1};
};
}  // namespace

std::string substitute_user(const std::string& tmpl, const std::string& user) {
    std::string out = tmpl;
    auto pos = out.find(kPlaceholder);
    if (pos != std::string::npos) out.replace(pos, 1, user);
    return out;
}

bool parse_targets_csv(std::istream& in, const std::string& user, std::vector<ProbeTarget>& out,
                       std::string& err) {
    CsvReader reader(in);
    std::vector<ProbeTarget> targets;
    std::vector<std::string> fields;
    size_t line = 0;
    while (true) {
        ReadStatus st = reader.next(fields, line, err);
        if (st == ReadStatus::Error) return false;
        if (st == ReadStatus::End) break;
        if (fields.size() != kFieldsPerRecord) {
            err = "line " + std::to_string(line) + " has wrong number of fields (" +
                  std::to_string(fields.size()) + ", want " + std::to_string(kFieldsPerRecord) +
                  ")";
            return false;
        }
        targets.push_back({fields[0], substitute_user(fields[1], user),
                           substitute_user(fields[2], user)});
    }
    if (in.bad()) {
        err = "read error";
        return false;
    }
    out = std::move(targets);
    return true;
}

bool load_targets(const std::string& path, const std::string& user,
                  std::vector<ProbeTarget>& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "while opening file \"" + path + "\": cannot open";
        return false;
    }
    std::string parse_err;
    if (!parse_targets_csv(in, user, out, parse_err)) {
        err = "while reading file \"" + path + "\": " + parse_err;
        return false;
    }
    if (out.empty()) {
        err = "csv file \"" + path + "\" is empty or is not valid";
        return false;
    }
    log(LogLevel::DEBUG, "loaded " + std::to_string(out.size()) + " targets from " + path);
    return true;
}
}  // namespace beagle
