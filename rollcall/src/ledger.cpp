#include "rollcall/ledger.h"
#include "rollcall/errors.h"
#include "text_util.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

using namespace rollcall;
using detail::trim;
namespace fs = std::filesystem;
using std::chrono::system_clock;

/* ---------------- time formatting ---------------- */

static std::tm local_tm(system_clock::time_point tp) {
    std::time_t t = system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

static std::string format_tm(system_clock::time_point tp, const char* fmt) {
    std::tm tm = local_tm(tp);
    std::ostringstream ss;
    ss << std::put_time(&tm, fmt);
    return ss.str();
}

std::string rollcall::format_date(system_clock::time_point tp) {
    return format_tm(tp, "%Y-%m-%d");
}

std::string rollcall::format_time(system_clock::time_point tp) {
    return format_tm(tp, "%H:%M:%S");
}

/* ---------------- CSV fields ---------------- */

static std::string csv_field(const std::string &s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos)
        return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

static std::string csv_row(const std::vector<std::string> &fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) out.push_back(',');
        out += csv_field(fields[i]);
    }
    return out;
}

// quote-aware split of one line; quoted fields may not span lines
static std::vector<std::string> csv_split(const std::string &line) {
    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    fields.push_back(std::move(cur));
    return fields;
}

/* ---------------- ledger ---------------- */

AttendanceLedger::AttendanceLedger(fs::path path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

void AttendanceLedger::ensure_header() const {
    if (fs::exists(path_))
        return;

    if (path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
        if (ec)
            throw RuntimeError("Cannot create directory " + path_.parent_path().string() +
                               ": " + ec.message());
    }

    std::ofstream out(path_);
    if (!out)
        throw RuntimeError("Cannot create attendance file " + path_.string());
    out << csv_row({"name", "date", "time"}) << "\n";
    out.flush();
    if (!out)
        throw RuntimeError("Failed to write header to " + path_.string());

    spdlog::debug("Created attendance file {}", path_.string());
}

std::vector<AttendanceRecord> AttendanceLedger::read_records() const {
    std::vector<AttendanceRecord> records;
    if (!fs::exists(path_))
        return records;

    std::ifstream in(path_);
    if (!in)
        throw RuntimeError("Cannot read attendance file " + path_.string());

    std::string line;
    if (!std::getline(in, line))
        return records;

    // columns are located by header name
    int name_col = -1, date_col = -1, time_col = -1;
    const auto header = csv_split(trim(line));
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string key = trim(header[i]);
        if (key == "name") name_col = static_cast<int>(i);
        else if (key == "date") date_col = static_cast<int>(i);
        else if (key == "time") time_col = static_cast<int>(i);
    }

    auto column = [](const std::vector<std::string> &row, int col) {
        return (col >= 0 && static_cast<size_t>(col) < row.size()) ? row[col] : std::string();
    };

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (trim(line).empty())
            continue;
        const auto row = csv_split(line);
        records.push_back({column(row, name_col), column(row, date_col), column(row, time_col)});
    }
    return records;
}

std::set<std::string> AttendanceLedger::names_on(const std::string& date) const {
    std::set<std::string> names;
    for (const auto &r : read_records()) {
        if (r.date == date)
            names.insert(trim(r.name));
    }
    return names;
}

bool AttendanceLedger::mark_attendance(const std::string& name) {
    const auto now = clock_();
    const std::string date = format_date(now);
    const std::string time = format_time(now);

    if (names_on(date).count(name))
        return false;

    std::ofstream out(path_, std::ios::app);
    if (!out)
        throw RuntimeError("Cannot open attendance file " + path_.string() + " for append");
    out << csv_row({name, date, time}) << "\n";
    out.flush();
    if (!out)
        throw RuntimeError("Failed to append to " + path_.string());

    spdlog::info("[attendance] Marked {} at {} {}", name, date, time);
    return true;
}
