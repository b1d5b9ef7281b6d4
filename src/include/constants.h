/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CONSTANTS_H
#define CONSTANTS_H

// Place name used when a file has no GPS position or it cannot be resolved
#define UNKNOWN_LOCATION "Unknown Location"

// Normalized keys of the raw metadata produced by the extractors
#define META_DATETIME_ORIGINAL "DateTimeOriginal"
#define META_DATETIME "DateTime"
#define META_CREATION_DATE "CreationDate"
#define META_GPS_LATITUDE "GPSLatitude"
#define META_GPS_LATITUDE_REF "GPSLatitudeRef"
#define META_GPS_LONGITUDE "GPSLongitude"
#define META_GPS_LONGITUDE_REF "GPSLongitudeRef"
#define META_MAKE "Make"
#define META_MODEL "Model"

#define PHOTO_EXTENSIONS {"jpg", "jpeg", "png", "heic", "heif", "gif"}
#define VIDEO_EXTENSIONS {"mov", "mp4", "m4v"}

#define GEOCODE_ATTEMPTS 3
#define GEOCODE_EMPTY_BACKOFF_SECONDS 1
#define GEOCODE_TIMEOUT_BACKOFF_SECONDS 2
#define DEFAULT_GEOCODE_TIMEOUT_SECONDS 10
#define DEFAULT_LOCATION_MEMO_CAPACITY 1024

#define NOMINATIM_DEFAULT_URL "https://nominatim.openstreetmap.org/reverse"
#define GOOGLE_GEOCODING_DEFAULT_URL "https://maps.googleapis.com/maps/api/geocode/json"

#define MAX_WORKERS 32

// Milliseconds a cache connection waits for a competing writer
#define CACHE_BUSY_TIMEOUT 10000

#endif // CONSTANTS_H
