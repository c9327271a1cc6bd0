#include <gtest/gtest.h>

#include "rollcall/errors.h"
#include "rollcall/ledger.h"
#include "test_support.h"

using namespace rollcall;
using namespace rollcall::test;

namespace {

AttendanceLedger::Clock clock_at(int days = 0) {
    return [days] { return fixed_time(days); };
}

} // namespace

TEST(Ledger, FormatsLocalDateAndTime) {
    EXPECT_EQ(format_date(fixed_time()), "2024-03-14");
    EXPECT_EQ(format_time(fixed_time()), "09:30:05");
}

TEST(Ledger, EnsureHeaderIsIdempotent) {
    TempDir dir;
    AttendanceLedger ledger(dir / "attendance.csv", clock_at());

    ledger.ensure_header();
    ledger.ensure_header();

    EXPECT_EQ(read_file(ledger.path()), "name,date,time\n");
    EXPECT_TRUE(ledger.read_records().empty());
}

TEST(Ledger, EnsureHeaderCreatesParentDirectories) {
    TempDir dir;
    AttendanceLedger ledger(dir / "logs" / "2024" / "attendance.csv", clock_at());

    ledger.ensure_header();

    EXPECT_TRUE(fs::is_regular_file(ledger.path()));
    EXPECT_EQ(read_lines(ledger.path()), (std::vector<std::string>{"name,date,time"}));
}

TEST(Ledger, EnsureHeaderLeavesExistingFileAlone) {
    TempDir dir;
    std::ofstream(dir / "attendance.csv") << "name,date,time\nAlice,2024-03-13,08:00:00\n";
    AttendanceLedger ledger(dir / "attendance.csv", clock_at());

    ledger.ensure_header();

    EXPECT_EQ(read_file(ledger.path()), "name,date,time\nAlice,2024-03-13,08:00:00\n");
}

TEST(Ledger, SameNameTwiceOnOneDayAppendsOnce) {
    TempDir dir;
    AttendanceLedger ledger(dir / "attendance.csv", clock_at());
    ledger.ensure_header();

    EXPECT_TRUE(ledger.mark_attendance("Alice"));
    EXPECT_FALSE(ledger.mark_attendance("Alice"));

    EXPECT_EQ(read_lines(ledger.path()),
              (std::vector<std::string>{"name,date,time", "Alice,2024-03-14,09:30:05"}));
}

TEST(Ledger, DifferentNamesOnOneDayAppendOneRowEach) {
    TempDir dir;
    AttendanceLedger ledger(dir / "attendance.csv", clock_at());
    ledger.ensure_header();

    EXPECT_TRUE(ledger.mark_attendance("Alice"));
    EXPECT_TRUE(ledger.mark_attendance("Bob"));
    EXPECT_FALSE(ledger.mark_attendance("Bob"));

    auto records = ledger.read_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].name, "Alice");
    EXPECT_EQ(records[1].name, "Bob");
    EXPECT_EQ(records[1].date, "2024-03-14");
    EXPECT_EQ(records[1].time, "09:30:05");
    EXPECT_EQ(ledger.names_on("2024-03-14"), (std::set<std::string>{"Alice", "Bob"}));
}

TEST(Ledger, NextDayRecordsAgain) {
    TempDir dir;
    {
        AttendanceLedger monday(dir / "attendance.csv", clock_at(0));
        monday.ensure_header();
        EXPECT_TRUE(monday.mark_attendance("Alice"));
    }
    AttendanceLedger tuesday(dir / "attendance.csv", clock_at(1));
    EXPECT_TRUE(tuesday.mark_attendance("Alice"));
    EXPECT_FALSE(tuesday.mark_attendance("Alice"));

    auto records = tuesday.read_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].date, "2024-03-14");
    EXPECT_EQ(records[1].date, "2024-03-15");
}

TEST(Ledger, RowsWrittenByEarlierRunsCount) {
    TempDir dir;
    std::ofstream(dir / "attendance.csv")
        << "name,date,time\r\n  Alice ,2024-03-14,08:00:00\r\n\r\n";
    AttendanceLedger ledger(dir / "attendance.csv", clock_at());

    EXPECT_FALSE(ledger.mark_attendance("Alice"));
    EXPECT_TRUE(ledger.mark_attendance("Bob"));
    EXPECT_EQ(ledger.names_on("2024-03-14"), (std::set<std::string>{"Alice", "Bob"}));
}

TEST(Ledger, ColumnsAreFoundByHeaderName) {
    TempDir dir;
    std::ofstream(dir / "attendance.csv") << "date,time,name\n2024-03-14,08:00:00,Alice\n";
    AttendanceLedger ledger(dir / "attendance.csv", clock_at());

    auto records = ledger.read_records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].name, "Alice");
    EXPECT_FALSE(ledger.mark_attendance("Alice"));
}

TEST(Ledger, FieldsWithCommasAndQuotesRoundTrip) {
    TempDir dir;
    AttendanceLedger ledger(dir / "attendance.csv", clock_at());
    ledger.ensure_header();

    EXPECT_TRUE(ledger.mark_attendance("Doe, Jane"));
    EXPECT_TRUE(ledger.mark_attendance("Jim \"JJ\" Beam"));
    EXPECT_FALSE(ledger.mark_attendance("Doe, Jane"));

    auto lines = read_lines(ledger.path());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "\"Doe, Jane\",2024-03-14,09:30:05");
    EXPECT_EQ(lines[2], "\"Jim \"\"JJ\"\" Beam\",2024-03-14,09:30:05");

    auto records = ledger.read_records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].name, "Doe, Jane");
    EXPECT_EQ(records[1].name, "Jim \"JJ\" Beam");
}

TEST(Ledger, MissingFileHasNoRecords) {
    TempDir dir;
    AttendanceLedger ledger(dir / "none.csv", clock_at());
    EXPECT_TRUE(ledger.read_records().empty());
    EXPECT_TRUE(ledger.names_on("2024-03-14").empty());
    EXPECT_EQ(ledger.today(), "2024-03-14");
}

TEST(Ledger, UnwritableLocationIsARuntimeError) {
    TempDir dir;
    std::ofstream(dir / "blocker") << "file, not a directory";
    AttendanceLedger ledger(dir / "blocker" / "attendance.csv", clock_at());

    EXPECT_THROW(ledger.ensure_header(), RuntimeError);
}
