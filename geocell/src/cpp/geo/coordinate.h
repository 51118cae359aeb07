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
 * coordinate.h
 */

#ifndef GEOCELL_GEO_COORDINATE_H_
#define GEOCELL_GEO_COORDINATE_H_

#include <cmath>

#include "geo/geo_exceptions.h"

namespace geocell {
namespace geo {

/**
 * A point on earth in degrees, latitude first.
 */
struct Coordinate {
  double latitude;
  double longitude;

  Coordinate() : latitude(0), longitude(0) {}
  Coordinate(double lat, double lon) : latitude(lat), longitude(lon) {}

  bool IsValid() const {
    return std::isfinite(latitude) && std::isfinite(longitude) &&
           latitude >= -90.0 && latitude <= 90.0 &&
           longitude >= -180.0 && longitude <= 180.0;
  }

  void Validate() const {
    if (!IsValid()) {
      throw InvalidCoordinateException("Invalid geo coordinates");
    }
  }

  bool operator==(const Coordinate& other) const {
    return latitude == other.latitude && longitude == other.longitude;
  }
};

} /* namespace geo */
} /* namespace geocell */

#endif /* GEOCELL_GEO_COORDINATE_H_ */
