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
 * distance_measurement.h
 */

#ifndef GEOCELL_GEO_DISTANCE_MEASUREMENT_H_
#define GEOCELL_GEO_DISTANCE_MEASUREMENT_H_

#include <cmath>
#include <string>

#include "geo/coordinate.h"
#include "geo/distance.h"
#include "geo/geo_exceptions.h"
#include "geo/geo_hash.h"

// #define ENABLE_TRACING
#include "util/trace.h"

namespace geocell {
namespace geo {

static const double kDefaultThresholdMeters = 50.0;
static const int kDefaultPrecision = 8;
static const int kDefaultMinPrecision = 5;
static const int kDefaultMaxPrecision = 12;

/**
 * Distance between two points, measured on the raw coordinates and on the
 * centers of their geohash cells.
 */
struct MeasurementResult {
  int precision;
  Coordinate origin;
  Coordinate target;
  std::string origin_hash;
  std::string target_hash;
  Coordinate origin_center;
  Coordinate target_center;
  double distance;
  double geohash_distance;

  double ApproximationError() const {
    return std::fabs(geohash_distance - distance);
  }

  /**
   * Whether origin lies within threshold_meters of target, compared in
   * whole meters.
   */
  bool IsWithin(double threshold_meters) const {
    return std::round(distance) <= threshold_meters;
  }
};

inline MeasurementResult Measure(const Coordinate& origin,
                                 const Coordinate& target,
                                 int precision) {
  MeasurementResult result;
  result.precision = precision;
  result.origin = origin;
  result.target = target;

  result.origin_hash = GeoHash::Encode(origin, precision);
  result.target_hash = GeoHash::Encode(target, precision);
  TRACE("hashes %s %s", result.origin_hash.c_str(),
        result.target_hash.c_str());

  result.origin_center = GeoHash::Decode(result.origin_hash);
  result.target_center = GeoHash::Decode(result.target_hash);

  result.distance = Distance(origin, target);
  result.geohash_distance =
      Distance(result.origin_center, result.target_center);
  TRACE("distance %f geohash distance %f", result.distance,
        result.geohash_distance);

  return result;
}

/**
 * Accuracy of a position fix in meters, must be finite and not negative.
 */
inline void ValidateAccuracy(double accuracy_meters) {
  if (!std::isfinite(accuracy_meters) || accuracy_meters < 0) {
    throw InvalidCoordinateException("Invalid accuracy: " +
                                     std::to_string(accuracy_meters));
  }
}

/**
 * Step precision by one, wrapping from max_precision back to min_precision.
 */
inline int NextPrecision(int precision, int min_precision,
                         int max_precision) {
  if (min_precision < 1 || min_precision > max_precision) {
    throw InvalidPrecisionException("Invalid precision range");
  }

  if (precision < min_precision || precision >= max_precision) {
    return min_precision;
  }

  return precision + 1;
}

} /* namespace geo */
} /* namespace geocell */

#endif /* GEOCELL_GEO_DISTANCE_MEASUREMENT_H_ */
