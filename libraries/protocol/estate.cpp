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
#include <estate/protocol/estate.hpp>
#include <estate/protocol/exceptions.hpp>

namespace estate {
   namespace protocol {
      void property_list_for_sale_operation::validate() const {
         ESTATE_ASSERT(price > 0, invalid_argument,
                       "The sale price should be positive rather than ${price}", ("price", price));
      }

      void offer_create_operation::validate() const {
         ESTATE_ASSERT(amount > 0, invalid_argument,
                       "An offer should carry a positive amount rather than ${amount}", ("amount", amount));
      }

      void property_list_for_rent_operation::validate() const {
         ESTATE_ASSERT(monthly_rent >= 0, invalid_argument,
                       "The monthly rent should not be negative (${rent})", ("rent", monthly_rent));
      }

      void property_rent_operation::validate() const {
         ESTATE_ASSERT(months > 0, invalid_argument,
                       "The rental term should be at least one month", ("months", months));
         ESTATE_ASSERT(amount >= 0, invalid_argument,
                       "The attached payment should not be negative (${amount})", ("amount", amount));
      }

      void rental_extend_operation::validate() const {
         ESTATE_ASSERT(additional_months > 0, invalid_argument,
                       "A rental extension should be at least one month", ("months", additional_months));
         ESTATE_ASSERT(amount >= 0, invalid_argument,
                       "The attached payment should not be negative (${amount})", ("amount", amount));
      }

      void auction_start_operation::validate() const {
         ESTATE_ASSERT(start_price >= 0, invalid_argument,
                       "The starting price should not be negative (${price})", ("price", start_price));
      }

      void auction_bid_operation::validate() const {
         ESTATE_ASSERT(amount > 0, invalid_argument,
                       "A bid should carry a positive amount rather than ${amount}", ("amount", amount));
      }

      void transfer_operation::validate() const {
         ESTATE_ASSERT(amount > 0, invalid_argument,
                       "A transfer should carry a positive amount rather than ${amount}", ("amount", amount));
      }
   }
}
