#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace rollcall {

struct AttendanceRecord {
    std::string name;
    std::string date;   // YYYY-MM-DD
    std::string time;   // HH:MM:SS
};

// local-time formatting used for ledger rows
std::string format_date(std::chrono::system_clock::time_point tp);
std::string format_time(std::chrono::system_clock::time_point tp);

// Append-only CSV attendance file with header "name,date,time" and at most
// one row per (name, date). Not safe for concurrent writers: each mark
// re-reads the file to rebuild the day's names before appending.
class AttendanceLedger {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit AttendanceLedger(std::filesystem::path path,
                              Clock clock = [] { return std::chrono::system_clock::now(); });

    // Create the file with its header row unless it already exists.
    // Parent directories are created as needed.
    void ensure_header() const;

    // Append [name, today, now] unless `name` is already recorded today.
    // Returns true when a row was written. Throws RuntimeError on I/O failure.
    bool mark_attendance(const std::string& name);

    // data rows in file order; empty when the file does not exist
    std::vector<AttendanceRecord> read_records() const;

    // trimmed names recorded on `date`
    std::set<std::string> names_on(const std::string& date) const;

    // today's date according to the ledger clock
    std::string today() const { return format_date(clock_()); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    Clock clock_;
};

} // namespace rollcall
