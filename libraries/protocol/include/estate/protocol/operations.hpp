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

#include <fc/static_variant.hpp>

#include <estate/protocol/estate.hpp>

namespace estate {
   namespace protocol {

      /**
       * @brief Every request the system accepts
       *
       * The position of each operation within the variant is its tag, which also selects its evaluator.
       */
      typedef fc::static_variant<
         property_mint_operation,           // 0
         property_set_manager_operation,    // 1
         property_list_for_sale_operation,  // 2
         offer_create_operation,            // 3
         offer_accept_operation,            // 4
         offer_withdraw_operation,          // 5
         property_list_for_rent_operation,  // 6
         property_rent_operation,           // 7
         rental_extend_operation,           // 8
         auction_start_operation,           // 9
         auction_bid_operation,             // 10
         auction_end_operation,             // 11
         transfer_operation                 // 12
      > operation;

      /// Minting yields the new property identifier; every other operation yields void_result
      typedef fc::static_variant<void_result, property_id_type> operation_result;

      /**
       * Validate an operation of any type
       */
      void operation_validate(const operation& op);

      /**
       * Account on whose behalf an operation runs
       */
      account_id_type operation_caller(const operation& op);

   }
} // estate::protocol
