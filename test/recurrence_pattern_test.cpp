#include "test_pch.h"
#include "core/recurrence_pattern.h"

#include <algorithm>
#include <sstream>
#include <vector>

using namespace std;
using namespace annum;
using namespace annum::core;
using boost::date_time::Jan;
using boost::date_time::Feb;
using boost::date_time::Apr;
using boost::date_time::May;
using boost::date_time::Jul;
using boost::date_time::Oct;
using boost::date_time::Nov;
using boost::date_time::Dec;
using boost::date_time::Sunday;
using boost::date_time::Monday;
using boost::date_time::Tuesday;
using boost::date_time::Wednesday;
using boost::date_time::Thursday;

TEST_SUITE("recurrence_pattern") {

TEST_CASE("test_nth_weekday_from_number") {
    TS_ASSERT_THROWS(nth_weekday_from_number(0), std::runtime_error);
    TS_ASSERT_EQUALS(nth_weekday_from_number(1), FIRST);
    TS_ASSERT_EQUALS(nth_weekday_from_number(4), FOURTH);
    TS_ASSERT_EQUALS(nth_weekday_from_number(5), FIFTH);
    TS_ASSERT_EQUALS(nth_weekday_from_number(6), LAST);
    TS_ASSERT_EQUALS(nth_weekday_from_number(42), LAST);
    TS_ASSERT_EQUALS(to_number(LAST), 6u);
    TS_ASSERT_EQUALS(to_string(THIRD), string("3rd"));
    TS_ASSERT_EQUALS(to_string(LAST), string("Last"));
}

TEST_CASE("test_construction_range_checks") {
    TS_ASSERT_THROWS_NOTHING(day_of_month(Feb, 29));
    TS_ASSERT_THROWS_NOTHING(day_of_month(Dec, 31));
    TS_ASSERT_THROWS(day_of_month(Feb, 30), std::runtime_error);
    TS_ASSERT_THROWS(day_of_month(Apr, 31), std::runtime_error);
    TS_ASSERT_THROWS(day_of_month(Jan, 32), std::runtime_error);
    TS_ASSERT_THROWS(day_of_month(Jan, 0), std::runtime_error);
    TS_ASSERT_THROWS(day_of_month(13, 1), std::runtime_error);
    TS_ASSERT_THROWS(day_of_month(0, 1), std::runtime_error);
    TS_ASSERT_THROWS(nth_weekday_of_month(0u, Thursday, 11), std::runtime_error);
    TS_ASSERT_THROWS(nth_weekday_of_month(4u, Thursday, 13), std::runtime_error);
    TS_ASSERT_EQUALS(nth_weekday_of_month(4u, Thursday, 11), nth_weekday_of_month(FOURTH, Thursday, Nov));
    TS_ASSERT_EQUALS(nth_weekday_of_month(9u, Monday, 5), nth_weekday_of_month(LAST, Monday, May));
}

TEST_CASE("test_day_of_month_equals_date") {
    day_of_month halloween(Oct, 31);
    TS_ASSERT(halloween == date(2020, 10, 31));
    TS_ASSERT(halloween == date(2021, 10, 31));
    TS_ASSERT(date(2021, 10, 31) == halloween);
    TS_ASSERT(halloween != date(2020, 10, 30));
    TS_ASSERT(halloween != date(2020, 11, 30));
    TS_ASSERT_EQUALS(day_of_month(date(2020, 10, 31)), halloween);
}

TEST_CASE("test_nth_weekday_of_month_equals_date") {
    nth_weekday_of_month tgives(FOURTH, Thursday, Nov);
    TS_ASSERT(tgives == date(2020, 11, 26));
    TS_ASSERT(tgives == date(2021, 11, 25));
    TS_ASSERT(tgives != date(2020, 11, 19));
    TS_ASSERT(tgives != date(2020, 11, 27));
    TS_ASSERT(tgives != date(2020, 10, 22));

    nth_weekday_of_month last_tue(LAST, Tuesday, Jul);
    nth_weekday_of_month fourth_tue(FOURTH, Tuesday, Jul);
    date d(2020, 7, 28);
    TS_ASSERT(last_tue == d);
    TS_ASSERT(fourth_tue == d);
    TS_ASSERT(last_tue != fourth_tue);
    TS_ASSERT(last_tue != date(2020, 7, 21));

    nth_weekday_of_month fifth_wed(FIFTH, Wednesday, Dec);
    TS_ASSERT(fifth_wed == date(2020, 12, 30));
    TS_ASSERT(fifth_wed != date(2022, 12, 28));// only four wednesdays in dec 2022
}

TEST_CASE("test_nth_weekday_of_month_from_date") {
    auto p = nth_weekday_of_month(date(2020, 6, 8));
    TS_ASSERT_EQUALS(p.nth, SECOND);
    TS_ASSERT_EQUALS(p.weekday, Monday);
    TS_ASSERT_EQUALS(p.month, boost::date_time::Jun);

    // round trip, numbered ranks reproduce the pattern
    nth_weekday_of_month tgives(FOURTH, Thursday, Nov);
    for (int y = 2015; y < 2030; ++y)
        TS_ASSERT_EQUALS(nth_weekday_of_month(tgives.in_year(y)), tgives);

    // LAST re-derives to the rank observed that year, and is only recoverable through is_last_weekday
    nth_weekday_of_month memorial(LAST, Monday, May);
    auto d2021 = memorial.in_year(2021);
    TS_ASSERT_EQUALS(d2021, date(2021, 5, 31));
    TS_ASSERT_EQUALS(nth_weekday_of_month(d2021), nth_weekday_of_month(FIFTH, Monday, May));
    TS_ASSERT(is_last_weekday(d2021));
    auto d2022 = memorial.in_year(2022);
    TS_ASSERT_EQUALS(d2022, date(2022, 5, 30));
    TS_ASSERT_EQUALS(nth_weekday_of_month(d2022).nth, FIFTH);
    auto d2023 = memorial.in_year(2023);
    TS_ASSERT_EQUALS(d2023, date(2023, 5, 29));
    TS_ASSERT_EQUALS(nth_weekday_of_month(d2023).nth, FIFTH);
    auto d2024 = memorial.in_year(2024);
    TS_ASSERT_EQUALS(d2024, date(2024, 5, 27));
    TS_ASSERT_EQUALS(nth_weekday_of_month(d2024).nth, FOURTH);
}

TEST_CASE("test_day_of_month_after_before") {
    day_of_month halloween(Oct, 31);
    TS_ASSERT_EQUALS(halloween.after(date(2020, 10, 31)), date(2020, 10, 31));// inclusive
    TS_ASSERT_EQUALS(halloween.after(date(2020, 11, 1)), date(2021, 10, 31));
    TS_ASSERT_EQUALS(halloween.after(date(2020, 1, 1)), date(2020, 10, 31));
    TS_ASSERT_EQUALS(halloween.before(date(2020, 10, 31)), date(2019, 10, 31));// exclusive
    TS_ASSERT_EQUALS(halloween.before(date(2020, 11, 1)), date(2020, 10, 31));

    day_of_month leap(Feb, 29);
    TS_ASSERT_EQUALS(leap.after(date(2021, 1, 1)), date(2024, 2, 29));
    TS_ASSERT_EQUALS(leap.before(date(2021, 1, 1)), date(2020, 2, 29));
    TS_ASSERT_EQUALS(leap.after(date(1897, 3, 1)), date(1904, 2, 29));// 1900 is not a leap year
}

TEST_CASE("test_nth_weekday_of_month_after_before") {
    nth_weekday_of_month tgives(FOURTH, Thursday, Nov);
    TS_ASSERT_EQUALS(tgives.after(date(2020, 11, 1)), date(2020, 11, 26));
    TS_ASSERT_EQUALS(tgives.after(date(2020, 11, 26)), date(2020, 11, 26));
    TS_ASSERT_EQUALS(tgives.after(date(2020, 11, 27)), date(2021, 11, 25));
    TS_ASSERT_EQUALS(tgives.after(date(2020, 3, 15)), date(2020, 11, 26));// jump forward within the year
    TS_ASSERT_EQUALS(tgives.after(date(2020, 12, 15)), date(2021, 11, 25));// jump to next year
    TS_ASSERT_EQUALS(tgives.before(date(2020, 11, 26)), date(2019, 11, 28));
    TS_ASSERT_EQUALS(tgives.before(date(2020, 11, 27)), date(2020, 11, 26));
    TS_ASSERT_EQUALS(tgives.before(date(2020, 12, 31)), date(2020, 11, 26));// jump back within the year
    TS_ASSERT_EQUALS(tgives.before(date(2021, 3, 1)), date(2020, 11, 26));// jump back to last year

    nth_weekday_of_month mlk(THIRD, Monday, Jan);
    TS_ASSERT_EQUALS(mlk.after(date(2021, 2, 1)), date(2022, 1, 17));
    TS_ASSERT_EQUALS(mlk.before(date(2021, 1, 1)), date(2020, 1, 20));

    nth_weekday_of_month dst_end(FIRST, Sunday, Nov);
    TS_ASSERT_EQUALS(dst_end.before(date(2021, 3, 1)), date(2020, 11, 1));

    nth_weekday_of_month memorial(LAST, Monday, May);
    TS_ASSERT_EQUALS(memorial.in_year(2021), date(2021, 5, 31));
    TS_ASSERT_EQUALS(memorial.before(date(2021, 6, 15)), date(2021, 5, 31));

    // a fifth weekday carries forward to the next year that has one
    nth_weekday_of_month fifth_wed(FIFTH, Wednesday, Dec);
    TS_ASSERT_EQUALS(fifth_wed.after(date(2022, 1, 1)), date(2025, 12, 31));
    TS_ASSERT_EQUALS(fifth_wed.before(date(2025, 12, 31)), date(2021, 12, 29));
}

TEST_CASE("test_nth_weekday_of_month_other_months") {
    // same weekday and rank, but in another month
    nth_weekday_of_month tgives(FOURTH, Thursday, Nov);
    TS_ASSERT(tgives != date(2020, 10, 22));
    TS_ASSERT(tgives != date(2021, 1, 28));
    TS_ASSERT_EQUALS(tgives.after(date(2020, 10, 22)), date(2020, 11, 26));
    TS_ASSERT_EQUALS(tgives.before(date(2021, 1, 29)), date(2020, 11, 26));

    nth_weekday_of_month memorial(LAST, Monday, May);
    TS_ASSERT(memorial != date(2021, 1, 25));
    TS_ASSERT_EQUALS(memorial.after(date(2021, 1, 25)), date(2021, 5, 31));
    TS_ASSERT_EQUALS(memorial.before(date(2021, 6, 1)), date(2021, 5, 31));
    TS_ASSERT_EQUALS(memorial.before(date(2021, 5, 31)), date(2020, 5, 25));

    nth_weekday_of_month mlk(THIRD, Monday, Jan);
    TS_ASSERT_EQUALS(mlk.before(date(2021, 3, 16)), date(2021, 1, 18));

    nth_weekday_of_month fifth_wed(FIFTH, Wednesday, Dec);
    TS_ASSERT_EQUALS(fifth_wed.after(date(2020, 9, 30)), date(2020, 12, 30));
}

TEST_CASE("test_in_year_table") {
    struct expected { nth_weekday_of_month p; int year; date d; };
    vector<expected> table {
        {nth_weekday_of_month(FOURTH, Thursday, Nov), 2017, date(2017, 11, 23)},
        {nth_weekday_of_month(FOURTH, Thursday, Nov), 2018, date(2018, 11, 22)},
        {nth_weekday_of_month(FOURTH, Thursday, Nov), 2019, date(2019, 11, 28)},
        {nth_weekday_of_month(FOURTH, Thursday, Nov), 2020, date(2020, 11, 26)},
        {nth_weekday_of_month(FOURTH, Thursday, Nov), 2021, date(2021, 11, 25)},
        {nth_weekday_of_month(FOURTH, Thursday, Nov), 2022, date(2022, 11, 24)},
        {nth_weekday_of_month(LAST, Monday, May), 2022, date(2022, 5, 30)},
        {nth_weekday_of_month(LAST, Monday, May), 2024, date(2024, 5, 27)},
        {nth_weekday_of_month(THIRD, Monday, Jan), 2020, date(2020, 1, 20)},
        {nth_weekday_of_month(THIRD, Monday, Jan), 2021, date(2021, 1, 18)},
        {nth_weekday_of_month(FIRST, Monday, boost::date_time::Sep), 2020, date(2020, 9, 7)},
        {nth_weekday_of_month(FIRST, Monday, boost::date_time::Sep), 2022, date(2022, 9, 5)},
        {nth_weekday_of_month(FIRST, Wednesday, Jan), 2024, date(2024, 1, 3)}
    };
    for (const auto& e : table)
        TS_ASSERT_EQUALS(e.p.in_year(e.year), e.d);
}

TEST_CASE("test_successor_predecessor_sweep") {
    vector<nth_weekday_of_month> patterns {
        nth_weekday_of_month(FOURTH, Thursday, Nov),
        nth_weekday_of_month(LAST, Monday, May),
        nth_weekday_of_month(FIFTH, Wednesday, Dec),
        nth_weekday_of_month(FIRST, Wednesday, Jan)
    };
    for (const auto& p : patterns) {
        for (date d(2019, 1, 1); d < date(2023, 1, 1); d = succ(d)) {
            auto a = p.after(d);
            TS_ASSERT_EQUALS(month_of(a), p.month);
            TS_ASSERT_EQUALS(p.after(succ(p.before(d))), a);
        }
    }
}

TEST_CASE("test_search_off_the_calendar") {
    day_of_month leap(Feb, 29);
    TS_ASSERT_THROWS(leap.after(date(9996, 3, 1)), no_occurrence_error);
    TS_ASSERT_THROWS(leap.before(min_date()), no_occurrence_error);
    nth_weekday_of_month tgives(FOURTH, Thursday, Nov);
    TS_ASSERT_THROWS(tgives.after(date(9999, 11, 29)), no_occurrence_error);
    TS_ASSERT_THROWS(tgives.before(date(1400, 11, 1)), no_occurrence_error);
    TS_ASSERT_THROWS(tgives.after(no_date()), std::runtime_error);
}

TEST_CASE("test_first_and_last_date") {
    TS_ASSERT_EQUALS(day_of_month(Jan, 1).first_date(), date(1400, 1, 1));
    TS_ASSERT_EQUALS(day_of_month(Dec, 25).last_date(), date(9999, 12, 25));
    TS_ASSERT_EQUALS(day_of_month(Dec, 31).last_date(), date(9998, 12, 31));// before is exclusive
    nth_weekday_of_month tgives(FOURTH, Thursday, Nov);
    TS_ASSERT(tgives.first_date().year() == 1400);
    TS_ASSERT(tgives == tgives.first_date());
    TS_ASSERT(tgives.last_date().year() == 9999);
    TS_ASSERT(tgives == tgives.last_date());
}

TEST_CASE("test_after_before_today") {
    nth_weekday_of_month tgives(FOURTH, Thursday, Nov);
    auto t = today();
    TS_ASSERT(tgives.after_today() >= t);
    TS_ASSERT(tgives.before_today() < t);
    TS_ASSERT(tgives == tgives.after_today());
    TS_ASSERT(tgives == tgives.before_today());
}

TEST_CASE("test_after_before_properties") {
    vector<recurrence_pattern> patterns {
        day_of_month(Oct, 31),
        day_of_month(Feb, 29),
        day_of_month(Jan, 1),
        nth_weekday_of_month(FOURTH, Thursday, Nov),
        nth_weekday_of_month(LAST, Monday, May),
        nth_weekday_of_month(FIFTH, Wednesday, Dec),
        nth_weekday_of_month(FIRST, Sunday, Jan)
    };
    for (const auto& p : patterns) {
        for (date d(2019, 12, 25); d < date(2024, 1, 1); d += date_duration(37)) {
            auto a = p.after(d);
            auto b = p.before(d);
            TS_ASSERT(a >= d);
            TS_ASSERT(b < d);
            TS_ASSERT(p == a);
            TS_ASSERT(p == b);
            TS_ASSERT_EQUALS(month_of(a), p.month());
            TS_ASSERT_EQUALS(month_of(b), p.month());
            TS_ASSERT_EQUALS(p.after(a), a);// a fixed point
            auto ba = p.before(a);// the occurrence before a, never d itself unless d < a
            TS_ASSERT(ba < a);
            TS_ASSERT_EQUALS(p.after(succ(ba)), a);// nothing in between
        }
    }
}

TEST_CASE("test_recurrence_pattern_dispatch") {
    recurrence_pattern fixed = day_of_month(Oct, 31);
    recurrence_pattern nth = nth_weekday_of_month(FOURTH, Thursday, Nov);
    TS_ASSERT(fixed.is_fixed());
    TS_ASSERT(!nth.is_fixed());
    TS_ASSERT(fixed.fixed_date() != nullptr);
    TS_ASSERT(fixed.nth_date() == nullptr);
    TS_ASSERT(nth.nth_date() != nullptr);
    TS_ASSERT_EQUALS(fixed.month(), Oct);
    TS_ASSERT_EQUALS(nth.month(), Nov);
    TS_ASSERT_EQUALS(fixed.after(date(2020, 11, 1)), date(2021, 10, 31));
    TS_ASSERT_EQUALS(nth.after(date(2020, 11, 1)), date(2020, 11, 26));
    TS_ASSERT_EQUALS(nth.before(date(2020, 11, 1)), date(2019, 11, 28));
    TS_ASSERT(nth == date(2021, 11, 25));
    TS_ASSERT(fixed != date(2021, 11, 25));
    TS_ASSERT(fixed != nth);
    TS_ASSERT(fixed == recurrence_pattern(day_of_month(Oct, 31)));
}

TEST_CASE("test_pattern_ordering") {
    // fixed dates by month then day
    TS_ASSERT(day_of_month(Oct, 31) < day_of_month(Nov, 1));
    TS_ASSERT(day_of_month(Dec, 24) < day_of_month(Dec, 25));
    TS_ASSERT(!(day_of_month(Dec, 25) < day_of_month(Dec, 25)));
    // nth patterns by month, then nth, then weekday counted from sunday
    TS_ASSERT(nth_weekday_of_month(LAST, Monday, May) < nth_weekday_of_month(FIRST, Sunday, Jun));
    TS_ASSERT(nth_weekday_of_month(SECOND, Sunday, May) < nth_weekday_of_month(LAST, Monday, May));
    TS_ASSERT(nth_weekday_of_month(FIRST, Sunday, Nov) < nth_weekday_of_month(FIRST, Monday, Nov));
    // within a month any fixed date comes before any nth weekday
    recurrence_pattern nov_30 = day_of_month(Nov, 30);
    recurrence_pattern first_sun_nov = nth_weekday_of_month(FIRST, Sunday, Nov);
    TS_ASSERT(nov_30 < first_sun_nov);
    TS_ASSERT(!(first_sun_nov < nov_30));
    TS_ASSERT(first_sun_nov > nov_30);
    // across months the month decides
    recurrence_pattern oct_31 = day_of_month(Oct, 31);
    recurrence_pattern dec_1 = day_of_month(Dec, 1);
    TS_ASSERT(oct_31 < first_sun_nov);
    TS_ASSERT(first_sun_nov < dec_1);
}

TEST_CASE("test_holiday") {
    holiday tgives("Thanksgiving", FOURTH, Thursday, Nov);
    holiday halloween("Halloween", Oct, 31);
    TS_ASSERT(tgives == date(2020, 11, 26));
    TS_ASSERT(tgives == nth_weekday_of_month(4u, Thursday, 11));
    TS_ASSERT(tgives != nth_weekday_of_month(3u, Thursday, 11));
    TS_ASSERT(halloween != nth_weekday_of_month(4u, Thursday, 11));
    TS_ASSERT_EQUALS(tgives.in_year(2020), date(2020, 11, 26));
    TS_ASSERT_EQUALS(halloween.in_year(2021), date(2021, 10, 31));

    // equal patterns order by name
    holiday a("All Hallows' Eve", Oct, 31);
    TS_ASSERT(a < halloween);
    TS_ASSERT(a != halloween);
    TS_ASSERT(halloween == holiday("Halloween", Oct, 31));

    vector<holiday> v {
        holiday("New Year's Eve", Dec, 31),
        tgives,
        holiday("New Year's Day", Jan, 1),
        halloween,
        holiday("Christmas", Dec, 25)
    };
    sort(v.begin(), v.end());
    TS_ASSERT_EQUALS(v[0].name, string("New Year's Day"));
    TS_ASSERT_EQUALS(v[1].name, string("Halloween"));
    TS_ASSERT_EQUALS(v[2].name, string("Thanksgiving"));
    TS_ASSERT_EQUALS(v[3].name, string("Christmas"));
    TS_ASSERT_EQUALS(v[4].name, string("New Year's Eve"));
}

TEST_CASE("test_to_string") {
    TS_ASSERT_EQUALS(day_of_month(Oct, 31).to_string(), string("October 31"));
    TS_ASSERT_EQUALS(nth_weekday_of_month(FOURTH, Thursday, Nov).to_string(), string("4th Thursday in November"));
    TS_ASSERT_EQUALS(nth_weekday_of_month(LAST, Monday, May).to_string(), string("Last Monday in May"));
    TS_ASSERT_EQUALS(holiday("Thanksgiving", FOURTH, Thursday, Nov).to_string(), string("Thanksgiving (4th Thursday in November)"));
    ostringstream os;
    os << recurrence_pattern(day_of_month(Dec, 25));
    TS_ASSERT_EQUALS(os.str(), string("December 25"));
}

}
