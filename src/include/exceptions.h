/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace phorg
{

    class AppException : public std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };
    class DBException : public AppException
    {
        using AppException::AppException;
    };
    class SQLException : public DBException
    {
        using DBException::DBException;
    };
    class FSException : public AppException
    {
        using AppException::AppException;
    };
    class CopyException : public FSException
    {
        using FSException::FSException;
    };
    class InvalidArgsException : public AppException
    {
        using AppException::AppException;
    };
    class MetadataException : public AppException
    {
        using AppException::AppException;
    };
    class MalformedCoordinateException : public AppException
    {
        using AppException::AppException;
    };
    class UnparseableDateException : public AppException
    {
        using AppException::AppException;
    };

    // Any reverse geocoding failure that must not be retried
    class GeocodeException : public AppException
    {
        using AppException::AppException;
    };

    // Transient: the request exceeded its per-attempt timeout
    class GeocodeTimeoutException : public GeocodeException
    {
        using GeocodeException::GeocodeException;
    };

    class InterruptedException : public AppException
    {
        using AppException::AppException;
    };

}

#endif // EXCEPTIONS_H
