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
 * configuration.h
 */

#ifndef GEOCELL_UTIL_CONFIGURATION_H_
#define GEOCELL_UTIL_CONFIGURATION_H_

#include <map>
#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "geo/distance_measurement.h"

// #define ENABLE_TRACING
#include "util/trace.h"

namespace geocell {
namespace util {

typedef std::map<std::string, std::string> measure_param_t;

static const char PRECISION_KEY[] = "precision";
static const char THRESHOLD_METERS_KEY[] = "threshold_meters";
static const char MIN_PRECISION_KEY[] = "min_precision";
static const char MAX_PRECISION_KEY[] = "max_precision";

struct configuration_error final : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

/**
 * Measurement parameters: defaults, overridden by a json file, overridden
 * by explicitly set values.
 */
class Configuration final {
 public:
  Configuration() : params_(DefaultParameters()) {}

  explicit Configuration(const measure_param_t& params)
      : params_(DefaultParameters()) {
    for (const auto& p : params) {
      Set(p.first, p.second);
    }
  }

  /**
   * Read a flat json object, e.g. {"precision": 9, "threshold_meters": 25}
   */
  void LoadJson(const std::string& filename) {
    if (!boost::filesystem::is_regular_file(filename)) {
      throw configuration_error("config file not found: " + filename);
    }

    boost::property_tree::ptree ptree;
    try {
      boost::property_tree::read_json(filename, ptree);
    } catch (const boost::property_tree::json_parser_error& e) {
      throw configuration_error("failed to parse config: " +
                                std::string(e.what()));
    }

    for (const auto& child : ptree) {
      if (!child.second.empty()) {
        throw configuration_error("nested value for key: " + child.first);
      }
      TRACE("config %s=%s", child.first.c_str(),
            child.second.data().c_str());
      Set(child.first, child.second.data());
    }
  }

  void Set(const std::string& key, const std::string& value) {
    if (params_.count(key) == 0) {
      throw configuration_error("unknown configuration key: " + key);
    }
    params_[key] = value;
  }

  int Precision() const { return Get<int>(PRECISION_KEY); }

  double ThresholdMeters() const { return Get<double>(THRESHOLD_METERS_KEY); }

  int MinPrecision() const { return Get<int>(MIN_PRECISION_KEY); }

  int MaxPrecision() const { return Get<int>(MAX_PRECISION_KEY); }

  void Validate() const {
    if (Precision() < 1) {
      throw configuration_error("precision must be positive");
    }
    if (ThresholdMeters() < 0) {
      throw configuration_error("threshold_meters must not be negative");
    }
    if (MinPrecision() < 1 || MinPrecision() > MaxPrecision()) {
      throw configuration_error(
          "min_precision must be positive and not exceed max_precision");
    }
  }

  const measure_param_t& Parameters() const { return params_; }

 private:
  measure_param_t params_;

  template <typename T>
  T Get(const std::string& key) const {
    const std::string& value = params_.at(key);
    try {
      return boost::lexical_cast<T>(value);
    } catch (const boost::bad_lexical_cast&) {
      throw configuration_error("invalid value for " + key + ": " + value);
    }
  }

  static measure_param_t DefaultParameters() {
    return measure_param_t{
        {PRECISION_KEY, std::to_string(geo::kDefaultPrecision)},
        {THRESHOLD_METERS_KEY,
         boost::lexical_cast<std::string>(geo::kDefaultThresholdMeters)},
        {MIN_PRECISION_KEY, std::to_string(geo::kDefaultMinPrecision)},
        {MAX_PRECISION_KEY, std::to_string(geo::kDefaultMaxPrecision)}};
  }
};

} /* namespace util */
} /* namespace geocell */

#endif /* GEOCELL_UTIL_CONFIGURATION_H_ */
