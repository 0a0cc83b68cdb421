#include "recurrence_pattern.h"
#include "core_log.h"

#include <ostream>
#include <sstream>

namespace annum {
    namespace core {
        using namespace std;

        dlib::logger dlog("annum.core");

        // one gregorian cycle (400 years) in days, every possible pattern recurs within it
        static const long max_scan_days = 146097L;

        static no_occurrence_error no_occurrence(const string& pattern, const char* direction, const date& d) {
            string msg = string("no occurrence of ") + pattern + string(" ") + direction + string(" ") + to_string(d)
                + string(" within the representable calendar");
            dlog << dlib::LWARN << msg;
            return no_occurrence_error(msg);
        }

        static void check_reference_date(const date& d) {
            if (!is_valid(d))
                throw runtime_error("occurrence search needs a valid reference date");
        }

        nth_weekday nth_weekday_from_number(unsigned n) {
            switch (n) {
                case 0: throw runtime_error("nth weekday must be non-zero");
                case 1: return FIRST;
                case 2: return SECOND;
                case 3: return THIRD;
                case 4: return FOURTH;
                case 5: return FIFTH;
                default: return LAST;
            }
        }

        string to_string(nth_weekday n) {
            switch (n) {
                case FIRST: return "1st";
                case SECOND: return "2nd";
                case THIRD: return "3rd";
                case FOURTH: return "4th";
                case FIFTH: return "5th";
                default: return "Last";
            }
        }

        //-- day_of_month

        day_of_month::day_of_month(month_t month, int day) : month(month), day(int16_t(day)) {
            if (!is_valid_month(int(month)))
                throw runtime_error("day_of_month: month must be in range 1..12");
            if (day < 1 || day > max_days_in_month(month))
                throw runtime_error(string("day_of_month: ") + month_name(month) + string(" never has day ") + std::to_string(day));
        }

        day_of_month::day_of_month(int month, int day) : day_of_month(is_valid_month(month) ? month_t(month) : boost::date_time::NotAMonth, day) {}

        day_of_month::day_of_month(const date& d) : month(month_of(d)), day(int16_t(d.day())) {}

        date day_of_month::after(const date& d) const {
            check_reference_date(d);
            date c = d;
            for (long n = 0; n < max_scan_days; ++n) {
                if (matches(c))
                    return c;
                if (c == max_date())
                    break;
                c = succ(c);
            }
            throw no_occurrence(to_string(), "at or after", d);
        }

        date day_of_month::before(const date& d) const {
            check_reference_date(d);
            if (d == min_date())
                throw no_occurrence(to_string(), "before", d);
            date c = pred(d);
            for (long n = 0; n < max_scan_days; ++n) {
                if (matches(c))
                    return c;
                if (c == min_date())
                    break;
                c = pred(c);
            }
            throw no_occurrence(to_string(), "before", d);
        }

        string day_of_month::to_string() const {
            return month_name(month) + string(" ") + std::to_string(int(day));
        }

        //-- nth_weekday_of_month

        nth_weekday_of_month::nth_weekday_of_month(nth_weekday nth, weekday_t weekday, month_t month)
            : nth(nth), weekday(weekday), month(month) {
            if (to_number(nth) < to_number(FIRST) || to_number(nth) > to_number(LAST))
                throw runtime_error("nth_weekday_of_month: nth must be in range 1..6");
            if (!is_valid_weekday(int(weekday)))
                throw runtime_error("nth_weekday_of_month: weekday must be in range 0..6");
            if (!is_valid_month(int(month)))
                throw runtime_error("nth_weekday_of_month: month must be in range 1..12");
        }

        nth_weekday_of_month::nth_weekday_of_month(unsigned nth, weekday_t weekday, int month)
            : nth_weekday_of_month(nth_weekday_from_number(nth), weekday,
                                   is_valid_month(month) ? month_t(month) : boost::date_time::NotAMonth) {}

        nth_weekday_of_month::nth_weekday_of_month(const date& d)
            : nth(nth_weekday_from_number(unsigned(weekday_rank(d)))), weekday(weekday_of(d)), month(month_of(d)) {}

        bool nth_weekday_of_month::matches(const date& d) const {
            if (month_of(d) != month || weekday_of(d) != weekday)
                return false;
            if (nth == LAST)
                return is_last_weekday(d);
            return unsigned(weekday_rank(d)) == to_number(nth);
        }

        date nth_weekday_of_month::after(const date& d) const {
            check_reference_date(d);
            const unsigned short m = static_cast<unsigned short>(month);
            date c = d;
            for (long n = 0; n < max_scan_days; ++n) {
                if (matches(c))
                    return c;
                auto cm = month_of(c);
                if (cm < month) {// jump forward to the target month this year
                    c = date(c.year(), m, 1);
                } else if (cm > month) {// passed it, jump to the target month next year
                    if (c.year() == max_date().year())
                        break;
                    c = date(static_cast<unsigned short>(c.year() + 1), m, 1);
                } else {
                    if (c == max_date())
                        break;
                    c = succ(c);
                }
            }
            throw no_occurrence(to_string(), "at or after", d);
        }

        date nth_weekday_of_month::before(const date& d) const {
            check_reference_date(d);
            if (d == min_date())
                throw no_occurrence(to_string(), "before", d);
            const unsigned short m = static_cast<unsigned short>(month);
            date c = pred(d);
            for (long n = 0; n < max_scan_days; ++n) {
                if (matches(c))
                    return c;
                auto cm = month_of(c);
                if (cm > month) {// jump back to the end of the target month this year
                    c = last_day_of_month(date(c.year(), m, 1));
                } else if (cm < month) {// jump back to the end of the target month last year
                    if (c.year() == min_date().year())
                        break;
                    c = last_day_of_month(date(static_cast<unsigned short>(c.year() - 1), m, 1));
                } else {
                    if (c == min_date())
                        break;
                    c = pred(c);
                }
            }
            throw no_occurrence(to_string(), "before", d);
        }

        string nth_weekday_of_month::to_string() const {
            return core::to_string(nth) + string(" ") + weekday_name(weekday) + string(" in ") + month_name(month);
        }

        //-- recurrence_pattern, dispatch to the active alternative

        namespace {
            struct after_visitor : boost::static_visitor<date> {
                const date& d;
                explicit after_visitor(const date& d) : d(d) {}
                template <class P>
                date operator()(const P& p) const { return p.after(d); }
            };

            struct before_visitor : boost::static_visitor<date> {
                const date& d;
                explicit before_visitor(const date& d) : d(d) {}
                template <class P>
                date operator()(const P& p) const { return p.before(d); }
            };

            struct matches_visitor : boost::static_visitor<bool> {
                const date& d;
                explicit matches_visitor(const date& d) : d(d) {}
                template <class P>
                bool operator()(const P& p) const { return p.matches(d); }
            };

            struct month_visitor : boost::static_visitor<month_t> {
                template <class P>
                month_t operator()(const P& p) const { return p.month; }
            };

            struct to_string_visitor : boost::static_visitor<string> {
                template <class P>
                string operator()(const P& p) const { return p.to_string(); }
            };

            /** within the same month a fixed date is always less than a nth weekday,
             * across months the month decides.
             */
            struct less_visitor : boost::static_visitor<bool> {
                bool operator()(const day_of_month& a, const day_of_month& b) const { return a < b; }
                bool operator()(const nth_weekday_of_month& a, const nth_weekday_of_month& b) const { return a < b; }
                bool operator()(const day_of_month& a, const nth_weekday_of_month& b) const {
                    return a.month == b.month ? true : a.month < b.month;
                }
                bool operator()(const nth_weekday_of_month& a, const day_of_month& b) const {
                    return a.month == b.month ? false : a.month < b.month;
                }
            };
        }

        month_t recurrence_pattern::month() const {
            return boost::apply_visitor(month_visitor(), value);
        }

        date recurrence_pattern::after(const date& d) const {
            return boost::apply_visitor(after_visitor(d), value);
        }

        date recurrence_pattern::before(const date& d) const {
            return boost::apply_visitor(before_visitor(d), value);
        }

        bool recurrence_pattern::matches(const date& d) const {
            return boost::apply_visitor(matches_visitor(d), value);
        }

        bool recurrence_pattern::operator<(const recurrence_pattern& o) const {
            return boost::apply_visitor(less_visitor(), value, o.value);
        }

        string recurrence_pattern::to_string() const {
            return boost::apply_visitor(to_string_visitor(), value);
        }

        //-- holiday

        string holiday::to_string() const {
            return name + string(" (") + pattern.to_string() + string(")");
        }

        //-- stream support

        ostream& operator<<(ostream& os, const day_of_month& p) { return os << p.to_string(); }
        ostream& operator<<(ostream& os, const nth_weekday_of_month& p) { return os << p.to_string(); }
        ostream& operator<<(ostream& os, const recurrence_pattern& p) { return os << p.to_string(); }
        ostream& operator<<(ostream& os, const holiday& h) { return os << h.to_string(); }
    }
}
