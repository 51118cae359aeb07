//
// geocell - geohash encoding and distance measurement.
//
// Copyright 2015 Hendrik Muhs<hendrik.muhs@gmail.com>
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

/*
 * geocellmeasure.cpp
 */

#include <cmath>
#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include "geo/distance_measurement.h"
#include "geo/geo_hash.h"
#include "util/configuration.h"

// #define ENABLE_TRACING
#include "util/trace.h"

namespace {

void PrintCoordinate(const char* label, const geocell::geo::Coordinate& c) {
  std::printf("%s: %.6f, %.6f\n", label, c.latitude, c.longitude);
}

void PrintMeasurement(const geocell::geo::MeasurementResult& m,
                      double threshold) {
  std::printf("Precision: %d\n", m.precision);
  std::printf("Origin hash: %s\n", m.origin_hash.c_str());
  std::printf("Target hash: %s\n", m.target_hash.c_str());
  PrintCoordinate("Origin cell center", m.origin_center);
  PrintCoordinate("Target cell center", m.target_center);
  std::printf("Distance: %.0f m\n", std::round(m.distance));
  std::printf("Geohash distance: %.0f m\n", std::round(m.geohash_distance));

  if (m.IsWithin(threshold)) {
    std::printf("Within %.0f m of target (%.0f m).\n", threshold,
                std::round(m.distance));
  } else {
    std::printf("%.0f m away from target.\n", std::round(m.distance));
  }
}

void PrintSweepLine(const geocell::geo::MeasurementResult& m) {
  std::printf("%2d  %-22s %-22s %12.0f %12.0f %12.0f\n", m.precision,
              m.origin_hash.c_str(), m.target_hash.c_str(),
              std::round(m.distance), std::round(m.geohash_distance),
              std::round(m.ApproximationError()));
}

void WarnIfBeyondUsefulPrecision(int precision) {
  using geocell::geo::GeoHash;
  if (GeoHash::IsBeyondUsefulPrecision(precision)) {
    std::cerr << "WARNING: precision " << precision << " is above "
              << +GeoHash::kMaxUsefulPrecision
              << ", trailing characters beyond that are rounding artifacts"
              << std::endl;
  }
}

void Decode(const std::string& hash) {
  const geocell::geo::Area area = geocell::geo::GeoHash::DecodeArea(hash);
  PrintCoordinate("Center", area.Center());
  PrintCoordinate("Cell min", area.Min());
  PrintCoordinate("Cell max", area.Max());
}

}  // namespace

int main(int argc, char** argv) {
  namespace po = boost::program_options;
  using geocell::geo::Coordinate;

  po::options_description description(
      "geocellmeasure options (pass negative values as --lat=-33.85)");

  description.add_options()("help,h", "produce help message");
  description.add_options()("lat", po::value<double>(), "origin latitude");
  description.add_options()("lon", po::value<double>(), "origin longitude");
  description.add_options()("accuracy", po::value<double>(),
                            "accuracy of the origin fix in meters");
  description.add_options()("target-lat", po::value<double>(),
                            "target latitude");
  description.add_options()("target-lon", po::value<double>(),
                            "target longitude");
  description.add_options()("precision,p", po::value<std::string>(),
                            "geohash length");
  description.add_options()("threshold,t", po::value<std::string>(),
                            "proximity threshold in meters");
  description.add_options()("config,c", po::value<std::string>(),
                            "json file with measurement parameters");
  description.add_options()("sweep,s",
                            "measure every precision between min_precision "
                            "and max_precision");
  description.add_options()("decode,d", po::value<std::string>(),
                            "decode a geohash and print its cell");

  po::variables_map vm;

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
    std::cerr << description;
    return 1;
  }

  if (vm.count("help")) {
    std::cout << description;
    return 0;
  }

  try {
    if (vm.count("decode")) {
      Decode(vm["decode"].as<std::string>());
      return 0;
    }

    if (!vm.count("lat") || !vm.count("lon") || !vm.count("target-lat") ||
        !vm.count("target-lon")) {
      std::cerr << "ERROR: --lat, --lon, --target-lat and --target-lon are "
                   "required" << std::endl << std::endl;
      std::cerr << description;
      return 1;
    }

    geocell::util::Configuration config;
    if (vm.count("config")) {
      config.LoadJson(vm["config"].as<std::string>());
    }
    if (vm.count("precision")) {
      config.Set(geocell::util::PRECISION_KEY,
                 vm["precision"].as<std::string>());
    }
    if (vm.count("threshold")) {
      config.Set(geocell::util::THRESHOLD_METERS_KEY,
                 vm["threshold"].as<std::string>());
    }
    config.Validate();

    const Coordinate origin(vm["lat"].as<double>(), vm["lon"].as<double>());
    const Coordinate target(vm["target-lat"].as<double>(),
                            vm["target-lon"].as<double>());
    origin.Validate();
    target.Validate();

    if (vm.count("accuracy")) {
      geocell::geo::ValidateAccuracy(vm["accuracy"].as<double>());
      std::printf("Origin: %.6f, %.6f +-%.0f m\n", origin.latitude,
                  origin.longitude, std::round(vm["accuracy"].as<double>()));
    } else {
      PrintCoordinate("Origin", origin);
    }
    PrintCoordinate("Target", target);

    if (vm.count("sweep")) {
      TRACE("sweep %d..%d", config.MinPrecision(), config.MaxPrecision());
      WarnIfBeyondUsefulPrecision(config.MaxPrecision());
      std::printf("%2s  %-22s %-22s %12s %12s %12s\n", "p", "origin",
                  "target", "distance", "geohash", "error");
      int precision = config.MinPrecision();
      do {
        PrintSweepLine(geocell::geo::Measure(origin, target, precision));
        precision = geocell::geo::NextPrecision(
            precision, config.MinPrecision(), config.MaxPrecision());
      } while (precision != config.MinPrecision());
      return 0;
    }

    const int precision = config.Precision();
    WarnIfBeyondUsefulPrecision(precision);

    PrintMeasurement(geocell::geo::Measure(origin, target, precision),
                     config.ThresholdMeters());
  } catch (const std::invalid_argument& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }

  return 0;
}
