#include "calendar_utilities.h"

#include <algorithm>
#include <cctype>

namespace annum {
    namespace core {
        using namespace std;

        date first_day_of_month(const date& d) {
            return date(d.year(), d.month(), 1);
        }

        date last_day_of_month(const date& d) {
            if (d.year() == max_date().year() && d.month() == boost::date_time::Dec)
                return max_date();// no next month to roll over to
            date next_month = d.month() == boost::date_time::Dec
                ? date(static_cast<unsigned short>(d.year() + 1), boost::date_time::Jan, 1)
                : date(d.year(), static_cast<unsigned short>(d.month().as_number() + 1), 1);
            return pred(next_month);
        }

        int days_in_month(const date& d) {
            return int(last_day_of_month(d).day());
        }

        int max_days_in_month(month_t m) {
            switch (m) {
                case boost::date_time::Feb: return 29;
                case boost::date_time::Apr:
                case boost::date_time::Jun:
                case boost::date_time::Sep:
                case boost::date_time::Nov: return 30;
                default: return 31;
            }
        }

        bool is_last_weekday(const date& d) {
            // the same weekday recurs 7 days later, if that is still within the month d is not the last
            return int(d.day()) + 7 > days_in_month(d);
        }

        int weekday_rank(const date& d) {
            return 1 + (int(d.day()) - 1) / 7;
        }

        long days_between(const date& a, const date& b) {
            return long((b - a).days());
        }

        string month_name(month_t m) {
            return boost::gregorian::greg_month(static_cast<unsigned short>(m)).as_long_string();
        }

        string weekday_name(weekday_t wd) {
            return boost::gregorian::greg_weekday(static_cast<unsigned short>(wd)).as_long_string();
        }

        string to_string(const date& d) {
            if (d.is_not_a_date()) return "no_date";
            if (d.is_neg_infinity()) return "-oo";
            if (d.is_pos_infinity()) return "+oo";
            return boost::gregorian::to_iso_extended_string(d);
        }

        date parse_date(const string& text) {
            string s(text);
            s.erase(s.begin(), find_if(s.begin(), s.end(), [](unsigned char c) { return !isspace(c); }));
            s.erase(find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !isspace(c); }).base(), s.end());
            if (s.empty())
                throw runtime_error("empty date text");
            // year, month and day, nothing more
            auto is_delimiter = [](char c) { return c == '-' || c == '/' || c == '.' || c == ',' || c == ' '; };
            size_t fields = 0;
            for (size_t i = 0; i < s.size(); ++i)
                if (!is_delimiter(s[i]) && (i == 0 || is_delimiter(s[i - 1])))
                    ++fields;
            if (fields > 3)
                throw runtime_error(string("'") + text + string("' is not a valid date: too many fields"));
            date r;
            try {
                bool undelimited = s.size() == 8 && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c) != 0; });
                r = undelimited ? boost::gregorian::from_undelimited_string(s) : boost::gregorian::from_simple_string(s);
            } catch (const exception& e) {
                throw runtime_error(string("'") + text + string("' is not a valid date: ") + e.what());
            }
            if (!is_valid(r))
                throw runtime_error(string("'") + text + string("' is not a valid date"));
            return r;
        }
    }
}
