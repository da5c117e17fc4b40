/** \file Export.hpp
 *  Symbol visibility macro for the QtCsvTable library.
 */
#pragma once
#include <QtCore/qglobal.h>

#if defined(QTCSVTABLE_STATIC)
#  define QTCSVTABLE_EXPORT
#elif defined(QTCSVTABLE_LIBRARY)
#  define QTCSVTABLE_EXPORT Q_DECL_EXPORT
#else
#  define QTCSVTABLE_EXPORT Q_DECL_IMPORT
#endif
