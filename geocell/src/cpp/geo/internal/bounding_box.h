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
 * bounding_box.h
 *
 * Bisection state shared by geohash encoding and decoding: the latitude and
 * longitude intervals plus a cursor that alternates between the axes,
 * longitude first.
 */

#ifndef GEOCELL_GEO_INTERNAL_BOUNDING_BOX_H_
#define GEOCELL_GEO_INTERNAL_BOUNDING_BOX_H_

#include "geo/area.h"
#include "geo/coordinate.h"

namespace geocell {
namespace geo {
namespace internal {

class BoundingBox final {
 public:
  BoundingBox() : area_(), longitude_active_(true) {
    area_.latitude = {-90.0, 90.0};
    area_.longitude = {-180.0, 180.0};
  }

  /**
   * Bisect the active axis around the given coordinate and switch axis.
   *
   * A value equal to the midpoint takes the lower half.
   *
   * @return the emitted bit
   */
  bool Narrow(const Coordinate& c) {
    const double value = longitude_active_ ? c.longitude : c.latitude;
    const bool bit = value > ActiveRange().Mid();
    Refine(bit);
    return bit;
  }

  /**
   * Keep the upper (bit set) or lower half of the active axis and switch axis.
   */
  void Refine(bool bit) {
    Range& range = ActiveRange();
    const double mid = range.Mid();
    if (bit) {
      range.min = mid;
    } else {
      range.max = mid;
    }
    longitude_active_ = !longitude_active_;
  }

  bool LongitudeActive() const { return longitude_active_; }

  const Area& GetArea() const { return area_; }

 private:
  Area area_;
  bool longitude_active_;

  Range& ActiveRange() {
    return longitude_active_ ? area_.longitude : area_.latitude;
  }
};

} /* namespace internal */
} /* namespace geo */
} /* namespace geocell */

#endif /* GEOCELL_GEO_INTERNAL_BOUNDING_BOX_H_ */
