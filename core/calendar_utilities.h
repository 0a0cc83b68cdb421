#pragma once

#include <string>
#include <stdexcept>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "core_pch.h"

namespace annum {
    namespace core {
        /** \brief date
         * basic type for calendar handling.
         * We use the proleptic gregorian calendar of boost::date_time,
         * resolution is 1 day, and the representable range is
         * 1400-01-01 .. 9999-12-31.
         * A default constructed date is 'not_a_date_time', and we use that
         * as the null/no date value.
         */
        typedef boost::gregorian::date date;
        typedef boost::gregorian::date_duration date_duration;
        typedef boost::date_time::weekdays weekday_t;       ///< Sunday=0 .. Saturday=6
        typedef boost::date_time::months_of_year month_t;   ///< Jan=1 .. Dec=12

        /** \brief min_date represent the first representable date */
        inline date min_date() { return date(boost::date_time::min_date_time); }

        /** \brief max_date represent the last representable date */
        inline date max_date() { return date(boost::date_time::max_date_time); }

        /** \brief no_date represents 'NaN' date, null date, not valid date */
        inline date no_date() { return date(boost::date_time::not_a_date_time); }

        inline bool is_valid(const date& d) { return !d.is_special(); }

        /** \brief today
         *  \return current local date from the system clock
         */
        inline date today() { return boost::gregorian::day_clock::local_day(); }

        ///< the next day, \note caller must ensure d < max_date()
        inline date succ(const date& d) { return d + date_duration(1); }

        ///< the previous day, \note caller must ensure d > min_date()
        inline date pred(const date& d) { return d - date_duration(1); }

        inline month_t month_of(const date& d) { return d.month().as_enum(); }
        inline weekday_t weekday_of(const date& d) { return d.day_of_week().as_enum(); }

        inline bool is_valid_month(int m) { return m >= 1 && m <= 12; }
        inline bool is_valid_weekday(int wd) { return wd >= 0 && wd <= 6; }

        /** \brief first day of the month of d */
        date first_day_of_month(const date& d);

        /** \brief last day of the month of d
         *
         * Computed as the day before the first day of the next month,
         * so that month lengths and leap years follow from the calendar
         * itself and not from a table.
         */
        date last_day_of_month(const date& d);

        ///< number of days in the month of d, 28..31
        int days_in_month(const date& d);

        /** \brief the maximum number of days month m can have in any year
         * \return 29 for February, 30 for April, June, September and November, otherwise 31
         */
        int max_days_in_month(month_t m);

        /** \brief true if no later day of the same month has the weekday of d */
        bool is_last_weekday(const date& d);

        /** \brief rank of d among the days of the month sharing its weekday
         * \return 1 for the first occurrence, .. 5 for the fifth
         */
        int weekday_rank(const date& d);

        ///< signed number of days from a to b, i.e. b-a
        long days_between(const date& a, const date& b);

        ///< days from today until d, negative if d is in the past
        inline long days_until(const date& d) { return days_between(today(), d); }

        ///< English month name, like 'November'
        std::string month_name(month_t m);

        ///< English weekday name, like 'Thursday'
        std::string weekday_name(weekday_t wd);

        ///< returns a readable iso standard string, yyyy-mm-dd
        std::string to_string(const date& d);

        /** \brief parse a plain date text
         *
         * Accepts the formats of boost::gregorian, i.e. 2021-11-25, 2021-Nov-25,
         * 2021/11/25 and the undelimited 20211125.
         * \throw std::runtime_error if the text is not a valid date
         */
        date parse_date(const std::string& text);
    }
}
