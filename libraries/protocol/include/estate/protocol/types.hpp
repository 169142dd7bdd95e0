/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <estate/protocol/config.hpp>

namespace estate {
   namespace protocol {
      using std::string;
      using std::vector;
      using fc::optional;
      using fc::time_point_sec;

      typedef fc::safe<int64_t> share_type;

      /// Property (asset) identifier allocated by the Property Registry
      typedef uint64_t property_id_type;

      /// Identifier of a single auction held for a property
      typedef uint64_t auction_id_type;

      /**
       * @brief Identity of an account that may call operations, hold title, or hold a balance
       */
      struct account_id_type {
         account_id_type() {}
         explicit account_id_type(uint64_t i) : instance(i) {}

         uint64_t instance = 0;

         friend bool operator == (const account_id_type& a, const account_id_type& b) {
            return a.instance == b.instance;
         }
         friend bool operator != (const account_id_type& a, const account_id_type& b) {
            return a.instance != b.instance;
         }
         friend bool operator < (const account_id_type& a, const account_id_type& b) {
            return a.instance < b.instance;
         }
      };

      struct void_result {};

   }
} // estate::protocol

FC_REFLECT( estate::protocol::account_id_type, (instance) )
FC_REFLECT( estate::protocol::void_result, )
