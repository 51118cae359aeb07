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
 * distance.h
 */

#ifndef GEOCELL_GEO_DISTANCE_H_
#define GEOCELL_GEO_DISTANCE_H_

#include <algorithm>
#include <cmath>

#include <boost/math/constants/constants.hpp>

#include "geo/coordinate.h"

namespace geocell {
namespace geo {

// mean earth radius in meters
static const double kEarthRadiusMeters = 6371000.0;

inline double DegreesToRadians(double degrees) {
  return degrees * boost::math::constants::pi<double>() / 180.0;
}

/**
 * Great-circle distance in meters (haversine).
 */
inline double Distance(const Coordinate& from, const Coordinate& to) {
  from.Validate();
  to.Validate();

  const double d_lat = DegreesToRadians(to.latitude - from.latitude);
  const double d_lon = DegreesToRadians(to.longitude - from.longitude);

  const double sin_d_lat = std::sin(d_lat / 2);
  const double sin_d_lon = std::sin(d_lon / 2);

  double a = sin_d_lat * sin_d_lat +
             std::cos(DegreesToRadians(from.latitude)) *
             std::cos(DegreesToRadians(to.latitude)) *
             sin_d_lon * sin_d_lon;

  // rounding can push a slightly above 1 near antipodal points
  a = std::min(1.0, std::max(0.0, a));

  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusMeters * c;
}

} /* namespace geo */
} /* namespace geocell */

#endif /* GEOCELL_GEO_DISTANCE_H_ */
