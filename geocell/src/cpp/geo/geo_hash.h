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
 * geo_hash.h
 *
 * inspired by https://github.com/lyokato/libgeohash/blob/master/src/geohash.c
 * rewritten into header-only file
 *
 *  Created on: Nov 5, 2015
 *      Author: hendrik
 */

#ifndef GEOCELL_GEO_GEO_HASH_H_
#define GEOCELL_GEO_GEO_HASH_H_

#include <cstddef>
#include <string>

#include "geo/area.h"
#include "geo/coordinate.h"
#include "geo/geo_exceptions.h"
#include "geo/internal/bounding_box.h"

namespace geocell {
namespace geo {

static const char GEOCELL_GEO_BASE32_ENCODE_TABLE[33] = "0123456789bcdefghjkmnpqrstuvwxyz";

// indexed by (character - '0'), lower case only
static const signed char GEOCELL_GEO_BASE32_DECODE_TABLE[75] = {
    /* 0 */   0, /* 1 */   1, /* 2 */   2, /* 3 */   3, /* 4 */   4,
    /* 5 */   5, /* 6 */   6, /* 7 */   7, /* 8 */   8, /* 9 */   9,
    /* : */  -1, /* ; */  -1, /* < */  -1, /* = */  -1, /* > */  -1,
    /* ? */  -1, /* @ */  -1, /* A */  -1, /* B */  -1, /* C */  -1,
    /* D */  -1, /* E */  -1, /* F */  -1, /* G */  -1, /* H */  -1,
    /* I */  -1, /* J */  -1, /* K */  -1, /* L */  -1, /* M */  -1,
    /* N */  -1, /* O */  -1, /* P */  -1, /* Q */  -1, /* R */  -1,
    /* S */  -1, /* T */  -1, /* U */  -1, /* V */  -1, /* W */  -1,
    /* X */  -1, /* Y */  -1, /* Z */  -1, /* [ */  -1, /* \ */  -1,
    /* ] */  -1, /* ^ */  -1, /* _ */  -1, /* ` */  -1, /* a */  -1,
    /* b */  10, /* c */  11, /* d */  12, /* e */  13, /* f */  14,
    /* g */  15, /* h */  16, /* i */  -1, /* j */  17, /* k */  18,
    /* l */  -1, /* m */  19, /* n */  20, /* o */  -1, /* p */  21,
    /* q */  22, /* r */  23, /* s */  24, /* t */  25, /* u */  26,
    /* v */  27, /* w */  28, /* x */  29, /* y */  30, /* z */  31
};

class GeoHash final {
 public:
  static const size_t kBitsPerCharacter = 5;

  /**
   * Beyond this length the cell bounds fall below double resolution and
   * further characters are rounding artifacts. Longer hashes are still
   * produced, there is no hard limit.
   */
  static const int kMaxUsefulPrecision = 22;

  static bool IsBeyondUsefulPrecision(int precision) {
    return precision > kMaxUsefulPrecision;
  }

  static std::string Encode(double lat, double lon, int precision) {
    return Encode(Coordinate(lat, lon), precision);
  }

  static std::string Encode(const Coordinate& coordinate, int precision) {
    coordinate.Validate();

    if (precision < 1) {
      throw InvalidPrecisionException("Unsupported geohash precision: " +
                                      std::to_string(precision));
    }

    internal::BoundingBox box;
    std::string hash;
    hash.resize(static_cast<size_t>(precision));

    for (size_t i = 0; i < hash.size(); ++i) {
      unsigned char bits = 0;
      for (size_t b = 0; b < kBitsPerCharacter; ++b) {
        bits = static_cast<unsigned char>(bits << 1);
        if (box.Narrow(coordinate)) {
          bits |= 0x1;
        }
      }

      hash[i] = GEOCELL_GEO_BASE32_ENCODE_TABLE[bits];
    }

    return hash;
  }

  /**
   * Decode a geohash into the center of its cell.
   */
  static Coordinate Decode(const std::string& hash) {
    return DecodeArea(hash).Center();
  }

  /**
   * Decode a geohash into its cell. The empty hash is the whole earth.
   */
  static Area DecodeArea(const std::string& hash) {
    internal::BoundingBox box;

    for (size_t i = 0; i < hash.size(); ++i) {
      const int bits = DecodeCharacter(hash[i], i);

      for (int offset = kBitsPerCharacter - 1; offset >= 0; --offset) {
        box.Refine(((bits >> offset) & 0x1) == 0x1);
      }
    }

    return box.GetArea();
  }

  static bool IsValid(const std::string& hash) {
    for (const char c : hash) {
      if (Lookup(c) == -1) {
        return false;
      }
    }
    return true;
  }

 private:
  static int Lookup(char c) {
    if (c < '0' || c > 'z') {
      return -1;
    }
    return GEOCELL_GEO_BASE32_DECODE_TABLE[c - '0'];
  }

  static int DecodeCharacter(char c, size_t position) {
    const int bits = Lookup(c);
    if (bits == -1) {
      throw InvalidCharacterException(c, position);
    }
    return bits;
  }
};

} /* namespace geo */
} /* namespace geocell */

#endif /* GEOCELL_GEO_GEO_HASH_H_ */
