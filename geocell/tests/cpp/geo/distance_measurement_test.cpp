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
 * distance_measurement_test.cpp
 */

#include <cmath>

#include <boost/math/constants/constants.hpp>
#include <boost/test/unit_test.hpp>

#include "geo/distance_measurement.h"

namespace geocell {
namespace geo {

namespace {

const Coordinate kSimulatorLocation(37.785834, -122.406417);
const Coordinate kSydneyOpera(-33.856784, 151.215297);
const Coordinate kUtsBuilding11(-33.883869, 151.199111);

// a point north of (0, 0) at the given distance
Coordinate NorthOfNullIsland(double meters) {
  const double meters_per_degree =
      kEarthRadiusMeters * boost::math::constants::pi<double>() / 180.0;
  return Coordinate(meters / meters_per_degree, 0.0);
}

}  // namespace

BOOST_AUTO_TEST_SUITE( DistanceMeasurementTests )

BOOST_AUTO_TEST_CASE( measure ) {
  MeasurementResult m = Measure(kSydneyOpera, kUtsBuilding11, 8);

  BOOST_CHECK_EQUAL(8, m.precision);
  BOOST_CHECK_EQUAL(GeoHash::Encode(kSydneyOpera, 8), m.origin_hash);
  BOOST_CHECK_EQUAL(GeoHash::Encode(kUtsBuilding11, 8), m.target_hash);
  BOOST_CHECK_EQUAL(Distance(kSydneyOpera, kUtsBuilding11), m.distance);
  BOOST_CHECK_EQUAL(GeoHash::Decode(m.origin_hash).latitude, m.origin_center.latitude);
  BOOST_CHECK_EQUAL(GeoHash::Decode(m.target_hash).longitude, m.target_center.longitude);
  BOOST_CHECK_EQUAL(Distance(m.origin_center, m.target_center), m.geohash_distance);
  BOOST_CHECK(m.origin == kSydneyOpera);
  BOOST_CHECK(m.target == kUtsBuilding11);

  // both centers are at most one precision 8 cell diagonal off
  BOOST_CHECK(m.ApproximationError() < 100.0);
  BOOST_CHECK_CLOSE(3362.0, m.distance, 1.0);
}

BOOST_AUTO_TEST_CASE( approximation_error_depends_on_precision ) {
  MeasurementResult coarse = Measure(kSydneyOpera, kUtsBuilding11, 2);
  MeasurementResult fine = Measure(kSydneyOpera, kUtsBuilding11, 9);

  BOOST_CHECK_EQUAL(coarse.distance, fine.distance);

  // at precision 2 both points share one cell
  BOOST_CHECK_EQUAL(coarse.origin_hash, coarse.target_hash);
  BOOST_CHECK_EQUAL(0.0, coarse.geohash_distance);
  BOOST_CHECK_EQUAL(coarse.distance, coarse.ApproximationError());

  BOOST_CHECK(fine.ApproximationError() < coarse.ApproximationError());
}

BOOST_AUTO_TEST_CASE( far_apart ) {
  MeasurementResult m = Measure(kSimulatorLocation, kSydneyOpera, 5);

  BOOST_CHECK_EQUAL("9q8yy", m.origin_hash);
  BOOST_CHECK(m.distance > 11900000.0);
  BOOST_CHECK(m.distance < 12000000.0);
  BOOST_CHECK(!m.IsWithin(kDefaultThresholdMeters));
}

BOOST_AUTO_TEST_CASE( within_threshold ) {
  const Coordinate null_island(0.0, 0.0);

  BOOST_CHECK(Measure(null_island, null_island, 8).IsWithin(kDefaultThresholdMeters));
  BOOST_CHECK(Measure(null_island, null_island, 8).IsWithin(0.0));

  // compared in whole meters
  BOOST_CHECK(Measure(null_island, NorthOfNullIsland(50.4), 8).IsWithin(50.0));
  BOOST_CHECK(!Measure(null_island, NorthOfNullIsland(50.6), 8).IsWithin(50.0));
  BOOST_CHECK(Measure(null_island, NorthOfNullIsland(50.6), 8).IsWithin(51.0));
}

BOOST_AUTO_TEST_CASE( invalid_input ) {
  BOOST_CHECK_THROW(Measure(Coordinate(100.0, 0.0), kSydneyOpera, 8),
                    InvalidCoordinateException);
  BOOST_CHECK_THROW(Measure(kSydneyOpera, Coordinate(0.0, 200.0), 8),
                    InvalidCoordinateException);
  BOOST_CHECK_THROW(Measure(kSydneyOpera, kUtsBuilding11, 0),
                    InvalidPrecisionException);
}

BOOST_AUTO_TEST_CASE( validate_accuracy ) {
  BOOST_CHECK_NO_THROW(ValidateAccuracy(0.0));
  BOOST_CHECK_NO_THROW(ValidateAccuracy(12.7));

  BOOST_CHECK_THROW(ValidateAccuracy(-5.0), InvalidCoordinateException);
  BOOST_CHECK_THROW(ValidateAccuracy(std::nan("")), InvalidCoordinateException);
  BOOST_CHECK_THROW(ValidateAccuracy(HUGE_VAL), InvalidCoordinateException);
}

BOOST_AUTO_TEST_CASE( next_precision ) {
  BOOST_CHECK_EQUAL(6, NextPrecision(5, 5, 12));
  BOOST_CHECK_EQUAL(12, NextPrecision(11, 5, 12));
  BOOST_CHECK_EQUAL(5, NextPrecision(12, 5, 12));

  // out of range values restart the cycle
  BOOST_CHECK_EQUAL(5, NextPrecision(1, 5, 12));
  BOOST_CHECK_EQUAL(5, NextPrecision(20, 5, 12));

  BOOST_CHECK_EQUAL(7, NextPrecision(7, 7, 7));

  BOOST_CHECK_THROW(NextPrecision(5, 0, 12), InvalidPrecisionException);
  BOOST_CHECK_THROW(NextPrecision(5, 12, 5), InvalidPrecisionException);
}

BOOST_AUTO_TEST_SUITE_END()

} /* namespace geo */
} /* namespace geocell */
