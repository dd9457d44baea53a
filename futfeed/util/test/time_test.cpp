#include "time_util.h"
#include "stdio.h"
#include <string>
#include "gtest/gtest.h"
#include <cstdlib>

TEST (TimeTest, FracReadWrite) {
    const char* ts1[] = {
        "20201101-02:00:00",
        "20200308-03:00:00.0",
        "20200101-20:16:32.123",
        "20201030-20:16:32.124678"};

    int dec1[] = {0,1,3,6};
    char buf[32];
    for (int i=0; i<4; ++i) {
        auto ts = ts1[i];
        auto dec = dec1[i];
        uint64_t utc = utils::TimeUtil::string_to_frac_UTC(ts, dec);
        utils::TimeUtil::frac_UTC_to_string(utc, buf, sizeof(buf), dec);
        printf("%s %lld %s %d\n", ts, (long long)utc, buf, (int)strcmp(ts, buf));
        EXPECT_STREQ (ts, buf);
    }

    // testing the current micro
    uint64_t cur_micro = utils::TimeUtil::cur_micro();
    std::string ct_milli = utils::TimeUtil::frac_UTC_to_string(0, 3, "%Y%m%d%H%M%S");
    uint64_t ct_milli_ts = utils::TimeUtil::string_to_frac_UTC(ct_milli.c_str(), 3, "%Y%m%d%H%M%S");
    EXPECT_LT(std::abs((long long) cur_micro - (long long)(ct_milli_ts*1000ULL)), 1000000LL -1);
}

TEST (TimeTest, FixedMilli) {
    const long long ms = utils::TimeUtil::fixed_string_to_milli("20230615093012123");
    EXPECT_EQ(ms % 1000, 123);
    EXPECT_STREQ(utils::TimeUtil::milli_to_string(ms).c_str(), "2023-06-15T09:30:12.123");
    EXPECT_STREQ(utils::TimeUtil::milli_to_string(ms, "%Y%m%d-%H:%M:%S").c_str(), "20230615-09:30:12.123");

    // no time zone is applied
    EXPECT_EQ(utils::TimeUtil::fixed_string_to_milli("19700101000000001"), 1LL);
    EXPECT_EQ(utils::TimeUtil::fixed_string_to_milli("19700102000000000"), 86400000LL);

    // leap day
    const long long leap = utils::TimeUtil::fixed_string_to_milli("20240229235959999");
    EXPECT_STREQ(utils::TimeUtil::milli_to_string(leap).c_str(), "2024-02-29T23:59:59.999");
    EXPECT_EQ(utils::TimeUtil::fixed_string_to_milli("20240301000000000") - leap, 1LL);
}

TEST (TimeTest, FixedMilliBad) {
    const char* bad[] = {
        "2023061509301212",     // short
        "202306150930121234",   // long
        "2023-06-1509301212",   // separator
        "20231315093012123",    // month
        "20230229093012123",    // not a leap year
        "20230615243012123",    // hour
        "20230615096012123",    // minute
        " 20230615093012123",
        ""};
    for (const auto* ts : bad) {
        EXPECT_THROW(utils::TimeUtil::fixed_string_to_milli(ts), std::invalid_argument) << ts;
    }
}

TEST (TimeTest, Calendar) {
    EXPECT_TRUE(utils::TimeUtil::isLeapYear(2000));
    EXPECT_TRUE(utils::TimeUtil::isLeapYear(2024));
    EXPECT_FALSE(utils::TimeUtil::isLeapYear(1900));
    EXPECT_FALSE(utils::TimeUtil::isLeapYear(2023));
    EXPECT_EQ(utils::TimeUtil::daysInMonth(2024, 2), 29);
    EXPECT_EQ(utils::TimeUtil::daysInMonth(2023, 2), 28);
    EXPECT_EQ(utils::TimeUtil::daysInMonth(2023, 12), 31);
    EXPECT_EQ(utils::TimeUtil::daysInMonth(2023, 11), 30);
}

TEST (TimeTest, MockTime) {
    // 2021-03-01 00:00:00 UTC
    utils::TimeUtil::set_cur_time_micro(1614556800ULL*1000000ULL);
    EXPECT_EQ(utils::TimeUtil::cur_utc(), (time_t)1614556800);
    EXPECT_EQ(utils::TimeUtil::cur_year(), 2021);
    utils::TimeUtil::unset_cur_time_micro();
    EXPECT_GE(utils::TimeUtil::cur_year(), 2021);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
