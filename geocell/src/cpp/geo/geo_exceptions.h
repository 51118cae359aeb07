/* * geocell - geohash encoding and distance measurement.
 *
 * Copyright 2015 Hendrik Muhs<hendrik.muhs@gmail.com>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/*
 * geo_exceptions.h
 */

#ifndef GEOCELL_GEO_GEO_EXCEPTIONS_H_
#define GEOCELL_GEO_GEO_EXCEPTIONS_H_

#include <cstddef>
#include <stdexcept>
#include <string>

namespace geocell {
namespace geo {

struct InvalidCoordinateException final : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

struct InvalidPrecisionException final : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

/**
 * Raised by the decoder for the first character outside of the geohash
 * alphabet.
 */
class InvalidCharacterException final : public std::invalid_argument {
 public:
  InvalidCharacterException(char character, size_t position)
      : std::invalid_argument(
            "Invalid character in geohash: '" + std::string(1, character) +
            "' at position " + std::to_string(position)),
        character_(character),
        position_(position) {}

  char character() const { return character_; }

  size_t position() const { return position_; }

 private:
  char character_;
  size_t position_;
};

} /* namespace geo */
} /* namespace geocell */

#endif /* GEOCELL_GEO_GEO_EXCEPTIONS_H_ */
