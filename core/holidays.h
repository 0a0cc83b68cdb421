#pragma once

#include <string>
#include <vector>

#include "recurrence_pattern.h"

namespace annum {
    namespace core {
        /** \brief a selection of predefined holidays, and lookup by name */
        namespace holidays {

            /** globally recognized holidays */
            namespace global {
                extern const holiday new_years_day;     ///< January 1
                extern const holiday st_patricks_day;   ///< March 17
                extern const holiday christmas_eve;     ///< December 24
                extern const holiday christmas;         ///< December 25
                extern const holiday new_years_eve;     ///< December 31
            }

            /** holidays in the United States */
            namespace united_states {
                extern const holiday mlkj_day;          ///< 3rd Monday in January
                extern const holiday groundhog_day;     ///< February 2
                extern const holiday superbowl_sunday;  ///< 1st Sunday in February
                extern const holiday presidents_day;    ///< 3rd Monday in February
                extern const holiday valentines_day;    ///< February 14
                extern const holiday dst_start;         ///< 2nd Sunday in March
                extern const holiday april_fools_day;   ///< April 1
                extern const holiday kentucky_derby;    ///< 1st Saturday in May
                extern const holiday memorial_day;      ///< Last Monday in May
                extern const holiday mothers_day;       ///< 2nd Sunday in May
                extern const holiday flag_day;          ///< June 14
                extern const holiday fathers_day;       ///< 3rd Sunday in June
                extern const holiday independence_day;  ///< July 4
                extern const holiday labor_day;         ///< 1st Monday in September
                extern const holiday columbus_day;      ///< 2nd Monday in October
                extern const holiday halloween;         ///< October 31
                extern const holiday veterans_day;      ///< November 11
                extern const holiday dst_end;           ///< 1st Sunday in November
                extern const holiday thanksgiving;      ///< 4th Thursday in November
            }

            /** \brief normalize a holiday name for lookup
             *
             * lower case, apostrophes removed, surrounding white space trimmed,
             * and any leading 'the ' words and trailing ' day' words stripped,
             * e.g. "The Fourth of July" -> "fourth of july", "Mother's Day" -> "mothers".
             */
            std::string normalize_name(const std::string& text);

            /** \brief returns the holiday given a name like "Thanksgiving" or "the 4th of July"
             * \throw std::runtime_error if the name is not recognized
             */
            holiday holiday_from_name(const std::string& text);

            /** \brief get list of all predefined holidays */
            std::vector<holiday> holiday_list();
        }
    }
}
