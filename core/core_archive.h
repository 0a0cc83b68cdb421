#pragma once

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include "core_pch.h"

/** the archives are written without the boost header */
#define core_arch_flags boost::archive::archive_flags::no_header

namespace annum {
    namespace core {
        using core_iarchive = boost::archive::binary_iarchive;
        using core_oarchive = boost::archive::binary_oarchive;

        /** member reference for archive operators, the name is for readability only */
        template <class T>
        inline T& core_nvp(const char*, T& t) { return t; }
    }
}

#define x_arch(T) x_serialize_archive(T,annum::core::core_oarchive,annum::core::core_iarchive)
