#include "core_pch.h"
#include "core_archive.h"

#include <boost/serialization/serialization.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/variant.hpp>

//
// 1. first include std stuff and the headers for
// files with serialization support
//

#include "recurrence_pattern.h"

//
// 2. Then implement each class serialization support
//

using namespace boost::serialization;
using namespace annum::core;

//-- recurrence_pattern.h

template<class Archive>
void annum::core::day_of_month::serialize(Archive & ar, const unsigned int version) {
    ar
    & core_nvp("month", month)
    & core_nvp("day", day)
    ;
}

template<class Archive>
void annum::core::nth_weekday_of_month::serialize(Archive & ar, const unsigned int version) {
    ar
    & core_nvp("nth", nth)
    & core_nvp("weekday", weekday)
    & core_nvp("month", month)
    ;
}

template<class Archive>
void annum::core::recurrence_pattern::serialize(Archive & ar, const unsigned int version) {
    ar
    & core_nvp("value", value)
    ;
}

template<class Archive>
void annum::core::holiday::serialize(Archive & ar, const unsigned int version) {
    ar
    & core_nvp("name", name)
    & core_nvp("pattern", pattern)
    ;
}

//
// 3. export the classes
//

x_serialize_implement(annum::core::day_of_month);
x_serialize_implement(annum::core::nth_weekday_of_month);
x_serialize_implement(annum::core::recurrence_pattern);
x_serialize_implement(annum::core::holiday);

//
// 4. Then include the archive supported
//
// repeat template instance for each archive class

x_arch(annum::core::day_of_month);
x_arch(annum::core::nth_weekday_of_month);
x_arch(annum::core::recurrence_pattern);
x_arch(annum::core::holiday);
