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
 * area.h
 */

#ifndef GEOCELL_GEO_AREA_H_
#define GEOCELL_GEO_AREA_H_

#include "geo/coordinate.h"

namespace geocell {
namespace geo {

struct Range {
  double min;
  double max;

  double Mid() const { return (max + min) / 2.0; }

  double Size() const { return max - min; }

  bool Contains(double value) const { return min <= value && value <= max; }
};

/**
 * Rectangular cell, the extent a geohash narrows down to.
 */
struct Area {
  Range latitude;
  Range longitude;

  Coordinate Min() const { return Coordinate(latitude.min, longitude.min); }

  Coordinate Max() const { return Coordinate(latitude.max, longitude.max); }

  Coordinate Center() const {
    return Coordinate(latitude.Mid(), longitude.Mid());
  }

  bool Contains(const Coordinate& c) const {
    return latitude.Contains(c.latitude) && longitude.Contains(c.longitude);
  }
};

} /* namespace geo */
} /* namespace geocell */

#endif /* GEOCELL_GEO_AREA_H_ */
