/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cstdlib>
#include <memory>
#include "meta.h"
#include "capturedate.h"
#include "coordinates.h"
#include "dispatcher.h"
#include "exceptions.h"
#include "geocache.h"
#include "location.h"
#include "metadata.h"
#include "phorg.h"
#include "userprofile.h"

namespace cmd {

void Meta::setOptions(cxxopts::Options &opts) {
    // clang-format off
    opts
    .positional_help("[args]")
    .custom_help("meta IMG_0001.JPG clip.mov")
    .add_options()
    ("i,input", "File(s) to examine", cxxopts::value<std::vector<std::string>>())
    ("f,format", "Output format (text|json)", cxxopts::value<std::string>()->default_value("text"))
    ("g,geocoder", "Reverse geocoding service (nominatim|google|none)", cxxopts::value<std::string>()->default_value("nominatim"))
    ("geocoder-url", "Override the geocoding service endpoint", cxxopts::value<std::string>()->default_value(""))
    ("no-cache", "Do not read or write the geocoding cache", cxxopts::value<bool>());
    // clang-format on
    opts.parse_positional({"input"});
}

std::string Meta::description() {
    return "Show the metadata, capture date and location of media files";
}

void Meta::run(cxxopts::ParseResult &opts) {
    if (!opts.count("input")) {
        printHelp();
    }

    const auto input = opts["input"].as<std::vector<std::string>>();
    const std::string format = opts["format"].as<std::string>();
    if (format != "text" && format != "json") throw phorg::InvalidArgsException("Invalid format " + format);

    const char *apiKeyEnv = std::getenv(PHORG_API_KEY_ENV);
    const std::string apiKey = apiKeyEnv != nullptr ? apiKeyEnv : "";

    std::shared_ptr<phorg::GeocodeCache> cache;
    if (!opts["no-cache"].count()) {
        cache = std::make_shared<phorg::GeocodeCache>(phorg::UserProfile::get()->getGeocodeCacheFile());
    }

    phorg::LocationResolver resolver(phorg::createGeocoder(opts["geocoder"].as<std::string>(), apiKey,
                                                           opts["geocoder-url"].as<std::string>()), cache);

    // Classification only, nothing is written
    phorg::MediaDispatcher classifier(nullptr, nullptr, nullptr, phorg::DestinationPathBuilder(fs::path()));
    auto photoExtractor = phorg::createPhotoExtractor();
    auto videoExtractor = phorg::createVideoExtractor();

    json out = json::array();

    for (const auto &i : input) {
        const fs::path p(i);
        const phorg::MediaType type = classifier.classify(p);

        json j;
        j["path"] = p.string();
        j["type"] = phorg::mediaTypeToHuman(type);

        if (type == phorg::MediaType::Unsupported) {
            out.push_back(j);
            continue;
        }

        json metadata = json::object();
        try {
            metadata = (type == phorg::MediaType::Photo ? photoExtractor : videoExtractor)->extract(p);
        } catch (const phorg::MetadataException &e) {
            j["error"] = e.what();
        }
        j["metadata"] = metadata;
        j["captureDate"] = phorg::DateResolver::toString(phorg::DateResolver::resolve(p, metadata));

        std::optional<phorg::Coordinate> coordinate;
        try {
            coordinate = phorg::extractCoordinate(metadata);
        } catch (const phorg::MalformedCoordinateException &e) {
            j["coordinateError"] = e.what();
        }
        if (coordinate) j["coordinate"] = {coordinate->latitude, coordinate->longitude};
        j["location"] = resolver.resolve(coordinate);

        out.push_back(j);
    }

    if (format == "json") {
        std::cout << out.dump(4) << std::endl;
        return;
    }

    size_t count = 0;
    for (const auto &j : out) {
        std::cout << "Path: " << j["path"].get<std::string>() << std::endl;
        std::cout << "Type: " << j["type"].get<std::string>() << std::endl;
        if (j.contains("error")) std::cout << "Error: " << j["error"].get<std::string>() << std::endl;
        if (j.contains("captureDate")) std::cout << "Capture date: " << j["captureDate"].get<std::string>() << std::endl;
        if (j.contains("coordinate")) std::cout << "Coordinate: " << j["coordinate"][0] << ", " << j["coordinate"][1] << std::endl;
        if (j.contains("location")) std::cout << "Location: " << j["location"].get<std::string>() << std::endl;
        if (j.contains("metadata")) {
            for (const auto &item : j["metadata"].items()) {
                std::string v = item.value().dump();
                if (item.value().is_string()) v = item.value().get<std::string>();
                std::cout << "  " << item.key() << ": " << v << std::endl;
            }
        }
        if (++count < out.size()) std::cout << "--------" << std::endl;
    }
}

}
