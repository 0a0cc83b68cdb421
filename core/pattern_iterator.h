#pragma once

#include <cstddef>
#include <iterator>

#include "calendar_utilities.h"
#include "recurrence_pattern.h"

namespace annum {
    namespace core {

        /** \brief pattern_iterator, walks the occurrences of an annually recurring date
         *
         * Enumerates the occurrences of P within the window [first..last],
         * forward using next() and backward using next_back(). Both directions
         * share one cursor, so they can be interleaved, e.g. step forward a few
         * years and then walk back again.
         *
         * The window defaults to the first and last representable occurrence,
         * and can be narrowed or moved using at(), starting_at() and ending_at().
         * An exhausted direction returns no_date().
         *
         * \tparam P an annual_date, like day_of_month, nth_weekday_of_month,
         *           recurrence_pattern or holiday, that provides after(date) and before(date)
         * \note the iterator keeps a reference to the pattern, which must outlive it.
         *       The cursor is mutable state, so an instance should be used by one thread only.
         */
        template <class P>
        class pattern_iterator {
            const P* p;
            date first_;
            date last_;
            date current_;
            bool at_start_;///< true if the cursor is just before current_, so current_ is the next forward candidate

            /** widen first_ and last_ to include d */
            void shift_from(const date& d) {
                if (d < first_) first_ = d;
                if (d > last_) last_ = d;
            }

          public:
            explicit pattern_iterator(const P& pattern)
                : p(&pattern), first_(pattern.first_date()), last_(pattern.last_date()), current_(first_), at_start_(true) {}

            const P& pattern() const { return *p; }
            date first() const { return first_; }
            date last() const { return last_; }

            /** \brief set the cursor just before d
             *
             * The next forward step yields the occurrence at or after d.
             * The window is widened to include d.
             */
            pattern_iterator& at(const date& d) {
                current_ = d;
                at_start_ = true;
                shift_from(d);
                return *this;
            }

            /** \brief start the window at the first occurrence at or after d
             *
             * The window is widened to include d. If there is no such occurrence
             * within the calendar the window simply starts at d.
             */
            pattern_iterator& starting_at(const date& d) {
                try {
                    first_ = p->after(d);
                } catch (const no_occurrence_error&) {
                    first_ = d;
                }
                shift_from(d);
                return *this;
            }

            /** \brief end the window at the last occurrence before d
             *
             * The window is widened to include d. If there is no such occurrence
             * within the calendar the window simply ends at d.
             */
            pattern_iterator& ending_at(const date& d) {
                try {
                    last_ = p->before(d);
                } catch (const no_occurrence_error&) {
                    last_ = d;
                }
                shift_from(d);
                return *this;
            }

            /** \brief forward step
             * \return the next occurrence after the cursor, or no_date() if it would pass last()
             */
            date next() {
                if (!at_start_ && current_ == max_date())
                    return no_date();
                date n;
                try {
                    n = p->after(at_start_ ? current_ : succ(current_));
                } catch (const no_occurrence_error&) {
                    return no_date();// ran off the calendar, nothing more forward
                }
                if (n > last_)
                    return no_date();
                current_ = n;
                at_start_ = false;
                return n;
            }

            /** \brief backward step
             * \return the previous occurrence before the cursor, or no_date() if the cursor is before first()
             */
            date next_back() {
                // the cursor is current_, or the day before it while at_start_
                if (at_start_ ? current_ <= first_ : current_ < first_)
                    return no_date();
                date b;
                try {
                    b = p->before(at_start_ ? pred(current_) : current_);
                } catch (const no_occurrence_error&) {
                    return no_date();
                }
                current_ = b;
                at_start_ = false;
                return b;
            }

            /** \brief input iterator over the remaining forward steps, to support range-for */
            class iterator {
                pattern_iterator* it;
                date value;
              public:
                typedef std::input_iterator_tag iterator_category;
                typedef date value_type;
                typedef std::ptrdiff_t difference_type;
                typedef const date* pointer;
                typedef const date& reference;

                iterator() : it(nullptr), value(no_date()) {}
                explicit iterator(pattern_iterator* it) : it(it), value(it->next()) {}
                reference operator*() const { return value; }
                pointer operator->() const { return &value; }
                iterator& operator++() {
                    value = it->next();
                    return *this;
                }
                iterator operator++(int) {
                    iterator r(*this);
                    ++(*this);
                    return r;
                }
                bool operator==(const iterator& o) const {
                    bool done = value.is_not_a_date(), o_done = o.value.is_not_a_date();
                    return done || o_done ? done == o_done : value == o.value;
                }
                bool operator!=(const iterator& o) const { return !operator==(o); }
            };

            iterator begin() { return iterator(this); }
            iterator end() { return iterator(); }
        };

        ///< convenience, pattern_iterator over the occurrences of p
        template <class P>
        inline pattern_iterator<P> occurrences(const P& p) { return pattern_iterator<P>(p); }
    }
}
