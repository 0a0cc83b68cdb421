#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>
#include <iosfwd>
#include <utility>

#include <boost/variant.hpp>

#include "core_pch.h"
#include "calendar_utilities.h"

namespace annum {
    namespace core {

        /** \brief thrown when a search for an occurrence leaves the representable calendar
         *
         * e.g. asking for the next February 29 after 9996-03-01, or a scan that
         * passed a full gregorian cycle without a match.
         */
        struct no_occurrence_error : std::runtime_error {
            explicit no_occurrence_error(const std::string& what) : std::runtime_error(what) {}
        };

        /** \brief the nth occurrence of a weekday within a month
         *
         * FIFTH is only satisfied in the months that do have a fifth occurrence,
         * LAST is satisfied by exactly one day each month.
         */
        enum nth_weekday : int8_t {
            FIRST = 1,
            SECOND = 2,
            THIRD = 3,
            FOURTH = 4,
            FIFTH = 5,
            LAST = 6
        };

        /** \brief convert a number to nth_weekday
         * \param n 1..5 gives FIRST..FIFTH, anything larger gives LAST
         * \throw std::runtime_error if n is zero
         */
        nth_weekday nth_weekday_from_number(unsigned n);

        inline unsigned to_number(nth_weekday n) { return unsigned(n); }

        ///< '1st','2nd','3rd','4th','5th' or 'Last'
        std::string to_string(nth_weekday n);

        /** \brief annual_date provides the operations every annually recurring date has
         *
         * D must provide:
         *  -# date after(const date& d) const, the first occurrence >= d
         *  -# date before(const date& d) const, the last occurrence < d
         *
         * and annual_date adds the ones derived from them.
         */
        template <class D>
        struct annual_date {
            ///< the next occurrence, including today
            date after_today() const { return self().after(today()); }
            ///< the previous occurrence, excluding today
            date before_today() const { return self().before(today()); }
            ///< the first representable occurrence
            date first_date() const { return self().after(min_date()); }
            ///< the last representable occurrence
            date last_date() const { return self().before(max_date()); }
            ///< the occurrence within year, \throw std::out_of_range if year is not representable
            date in_year(int year) const {
                return self().after(date(static_cast<unsigned short>(year), boost::date_time::Jan, 1));
            }
          protected:
            const D& self() const { return static_cast<const D&>(*this); }
        };

        /** \brief a fixed day of the month, like October 31
         *
         * \note the constructor rejects day/month combinations that can never
         *       occur, e.g. February 30.
         */
        struct day_of_month : annual_date<day_of_month> {
            month_t month;
            int16_t day;

            day_of_month() : month(boost::date_time::Jan), day(1) {}// serialization
            day_of_month(month_t month, int day);
            day_of_month(int month, int day);
            ///< the day_of_month d is an occurrence of
            explicit day_of_month(const date& d);

            date after(const date& d) const;
            date before(const date& d) const;

            ///< true if d is an occurrence, i.e. month and day match
            bool matches(const date& d) const {
                return month_of(d) == month && int(d.day()) == int(day);
            }
            bool operator==(const day_of_month& o) const { return month == o.month && day == o.day; }
            bool operator!=(const day_of_month& o) const { return !operator==(o); }
            bool operator<(const day_of_month& o) const {
                return month == o.month ? day < o.day : month < o.month;
            }
            std::string to_string() const;
            x_serialize_decl();
        };

        /** \brief the nth weekday of a month, like the 4th Thursday in November */
        struct nth_weekday_of_month : annual_date<nth_weekday_of_month> {
            nth_weekday nth;
            weekday_t weekday;
            month_t month;

            nth_weekday_of_month() : nth(FIRST), weekday(boost::date_time::Sunday), month(boost::date_time::Jan) {}// serialization
            nth_weekday_of_month(nth_weekday nth, weekday_t weekday, month_t month);
            nth_weekday_of_month(unsigned nth, weekday_t weekday, int month);

            /** \brief the nth_weekday_of_month d is an occurrence of
             *
             * Counts the days with the weekday of d from the first of the month
             * through d, so the result is always FIRST..FIFTH, never LAST.
             */
            explicit nth_weekday_of_month(const date& d);

            date after(const date& d) const;
            date before(const date& d) const;

            /** \brief true if d is an occurrence
             *
             * The month and weekday must match, and then d must either be the last such
             * weekday of its month (LAST), or have the rank nth within its month.
             */
            bool matches(const date& d) const;

            bool operator==(const nth_weekday_of_month& o) const {
                return nth == o.nth && weekday == o.weekday && month == o.month;
            }
            bool operator!=(const nth_weekday_of_month& o) const { return !operator==(o); }
            ///< month, then nth, then weekday counted from sunday
            bool operator<(const nth_weekday_of_month& o) const {
                if (month != o.month) return month < o.month;
                if (nth != o.nth) return nth < o.nth;
                return weekday < o.weekday;
            }
            std::string to_string() const;
            x_serialize_decl();
        };

        /** \brief recurrence_pattern, either a fixed day_of_month or a nth_weekday_of_month
         *
         * The ordering is for sorting and display only:
         * patterns order by month, and within the same month any day_of_month
         * sorts before any nth_weekday_of_month.
         */
        struct recurrence_pattern : annual_date<recurrence_pattern> {
            typedef boost::variant<day_of_month, nth_weekday_of_month> value_t;
            value_t value;

            recurrence_pattern() {}// serialization
            recurrence_pattern(const day_of_month& p) : value(p) {}
            recurrence_pattern(const nth_weekday_of_month& p) : value(p) {}

            bool is_fixed() const { return value.which() == 0; }
            ///< the day_of_month, or nullptr if this is a nth_weekday_of_month
            const day_of_month* fixed_date() const { return boost::get<day_of_month>(&value); }
            ///< the nth_weekday_of_month, or nullptr if this is a day_of_month
            const nth_weekday_of_month* nth_date() const { return boost::get<nth_weekday_of_month>(&value); }
            month_t month() const;

            date after(const date& d) const;
            date before(const date& d) const;
            bool matches(const date& d) const;

            bool operator==(const recurrence_pattern& o) const { return value == o.value; }
            bool operator!=(const recurrence_pattern& o) const { return !operator==(o); }
            bool operator<(const recurrence_pattern& o) const;
            std::string to_string() const;
            x_serialize_decl();
        };

        /** \brief holiday, a recurrence_pattern with a name
         *
         * The name is only used for display, and for equality and ordering
         * where it breaks ties between equal patterns.
         */
        struct holiday : annual_date<holiday> {
            std::string name;
            recurrence_pattern pattern;

            holiday() {}// serialization
            holiday(std::string name, recurrence_pattern pattern) : name(std::move(name)), pattern(std::move(pattern)) {}
            ///< a fixed date holiday
            holiday(std::string name, month_t month, int day) : name(std::move(name)), pattern(day_of_month(month, day)) {}
            ///< a nth weekday of the month holiday
            holiday(std::string name, nth_weekday nth, weekday_t weekday, month_t month)
                : name(std::move(name)), pattern(nth_weekday_of_month(nth, weekday, month)) {}

            date after(const date& d) const { return pattern.after(d); }
            date before(const date& d) const { return pattern.before(d); }
            bool matches(const date& d) const { return pattern.matches(d); }

            bool operator==(const holiday& o) const { return pattern == o.pattern && name == o.name; }
            bool operator!=(const holiday& o) const { return !operator==(o); }
            bool operator<(const holiday& o) const { return pattern == o.pattern ? name < o.name : pattern < o.pattern; }
            ///< like 'Thanksgiving (4th Thursday in November)'
            std::string to_string() const;
            x_serialize_decl();
        };

        // pattern versus concrete date, both ways round
        inline bool operator==(const day_of_month& p, const date& d) { return p.matches(d); }
        inline bool operator==(const date& d, const day_of_month& p) { return p.matches(d); }
        inline bool operator!=(const day_of_month& p, const date& d) { return !p.matches(d); }
        inline bool operator!=(const date& d, const day_of_month& p) { return !p.matches(d); }

        inline bool operator==(const nth_weekday_of_month& p, const date& d) { return p.matches(d); }
        inline bool operator==(const date& d, const nth_weekday_of_month& p) { return p.matches(d); }
        inline bool operator!=(const nth_weekday_of_month& p, const date& d) { return !p.matches(d); }
        inline bool operator!=(const date& d, const nth_weekday_of_month& p) { return !p.matches(d); }

        inline bool operator==(const recurrence_pattern& p, const date& d) { return p.matches(d); }
        inline bool operator==(const date& d, const recurrence_pattern& p) { return p.matches(d); }
        inline bool operator!=(const recurrence_pattern& p, const date& d) { return !p.matches(d); }
        inline bool operator!=(const date& d, const recurrence_pattern& p) { return !p.matches(d); }

        inline bool operator==(const holiday& h, const date& d) { return h.matches(d); }
        inline bool operator==(const date& d, const holiday& h) { return h.matches(d); }
        inline bool operator!=(const holiday& h, const date& d) { return !h.matches(d); }
        inline bool operator!=(const date& d, const holiday& h) { return !h.matches(d); }

        // a holiday equals a nth_weekday_of_month only if that is its pattern
        inline bool operator==(const holiday& h, const nth_weekday_of_month& p) {
            auto n = h.pattern.nth_date();
            return n != nullptr && *n == p;
        }
        inline bool operator!=(const holiday& h, const nth_weekday_of_month& p) { return !(h == p); }

        inline bool operator>(const day_of_month& a, const day_of_month& b) { return b < a; }
        inline bool operator>(const nth_weekday_of_month& a, const nth_weekday_of_month& b) { return b < a; }
        inline bool operator>(const recurrence_pattern& a, const recurrence_pattern& b) { return b < a; }
        inline bool operator>(const holiday& a, const holiday& b) { return b < a; }

        std::ostream& operator<<(std::ostream& os, const day_of_month& p);
        std::ostream& operator<<(std::ostream& os, const nth_weekday_of_month& p);
        std::ostream& operator<<(std::ostream& os, const recurrence_pattern& p);
        std::ostream& operator<<(std::ostream& os, const holiday& h);
    }
}
//-- serialization support: expose class keys
x_serialize_export_key(annum::core::day_of_month);
x_serialize_export_key(annum::core::nth_weekday_of_month);
x_serialize_export_key(annum::core::recurrence_pattern);
x_serialize_export_key(annum::core::holiday);
