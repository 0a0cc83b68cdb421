#ifndef _annum_core_serialize_h
#define _annum_core_serialize_h

#include <boost/serialization/access.hpp>
#include <boost/serialization/export.hpp>

/** last line of a serializable struct, declares the private serialize template */
#define x_serialize_decl() \
    private:\
    friend class boost::serialization::access;\
    template<class Archive>\
    void serialize(Archive & ar, const unsigned int file_version)

/** after the namespace, at the end of the header declaring T */
#define x_serialize_export_key(T) BOOST_CLASS_EXPORT_KEY(T)

/** in core_serialization.cpp, after T::serialize is defined */
#define x_serialize_implement(T) BOOST_CLASS_EXPORT_IMPLEMENT(T)

/** instantiate T::serialize for the output archive AO and input archive AI */
#define x_serialize_archive(T,AO,AI) \
    template void T::serialize(AO &, const unsigned int);\
    template void T::serialize(AI &, const unsigned int);

#endif // _annum_core_serialize_h
