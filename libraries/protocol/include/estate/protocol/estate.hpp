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

#include <estate/protocol/types.hpp>

namespace estate {
   namespace protocol {
      struct property_mint_operation {
         /// This account must be privileged by Access Control
         account_id_type issuer;

         /// Initial title holder of the new property
         account_id_type to;

         string location;

         /// Floor area in square units
         uint64_t area = 0;

         string category;

         void validate() const {}

         account_id_type caller() const { return issuer; }
      };

      struct property_set_manager_operation {
         /// This account must be the title holder of the property
         account_id_type owner;

         property_id_type property = 0;

         /// New manager of the property; an absent value removes the current manager
         optional<account_id_type> manager;

         void validate() const {}

         account_id_type caller() const { return owner; }
      };

      struct property_list_for_sale_operation {
         /// This account must be the title holder or the manager of the property
         account_id_type seller;

         property_id_type property = 0;

         /// Asking price in the native currency
         share_type price;

         void validate() const;

         account_id_type caller() const { return seller; }
      };

      struct offer_create_operation {
         /// The bidder whose offer is held in escrow
         account_id_type bidder;

         property_id_type property = 0;

         /// Value attached to the offer and withdrawn from the bidder's balance.
         /// Replaces any earlier offer by the same bidder for the same property.
         share_type amount;

         void validate() const;

         account_id_type caller() const { return bidder; }
      };

      struct offer_accept_operation {
         /// This account must be the title holder or the manager of the property
         account_id_type seller;

         property_id_type property = 0;

         /// Bidder whose escrowed offer is accepted
         account_id_type buyer;

         void validate() const {}

         account_id_type caller() const { return seller; }
      };

      struct offer_withdraw_operation {
         account_id_type bidder;

         property_id_type property = 0;

         void validate() const {}

         account_id_type caller() const { return bidder; }
      };

      struct property_list_for_rent_operation {
         /// This account must be the title holder or the manager of the property
         account_id_type landlord;

         property_id_type property = 0;

         /// Rent for one fixed-length month; zero withdraws the rental listing
         share_type monthly_rent;

         void validate() const;

         account_id_type caller() const { return landlord; }
      };

      struct property_rent_operation {
         account_id_type renter;

         property_id_type property = 0;

         /// Rental term in fixed-length months
         uint32_t months = 0;

         /// Value attached to the rental.  Anything above monthly_rent * months is retained.
         share_type amount;

         void validate() const;

         account_id_type caller() const { return renter; }
      };

      struct rental_extend_operation {
         /// This account must be the renter of record
         account_id_type renter;

         property_id_type property = 0;

         uint32_t additional_months = 0;

         share_type amount;

         void validate() const;

         account_id_type caller() const { return renter; }
      };

      struct auction_start_operation {
         /// This account must be the title holder or the manager of the property
         account_id_type seller;

         property_id_type property = 0;

         /// Lowest acceptable bid
         share_type start_price;

         /// Seconds from now until bidding closes
         uint32_t duration = 0;

         void validate() const;

         account_id_type caller() const { return seller; }
      };

      struct auction_bid_operation {
         account_id_type bidder;

         property_id_type property = 0;

         /// Value attached to the bid.  Refunded in full if the bid is later outbid.
         share_type amount;

         void validate() const;

         account_id_type caller() const { return bidder; }
      };

      struct auction_end_operation {
         /// Any account may settle an auction once its end time has passed
         account_id_type closer;

         property_id_type property = 0;

         void validate() const {}

         account_id_type caller() const { return closer; }
      };

      /**
       * @brief Move native currency between two accounts
       */
      struct transfer_operation {
         account_id_type from;

         account_id_type to;

         share_type amount;

         void validate() const;

         account_id_type caller() const { return from; }
      };

   }
}

FC_REFLECT( estate::protocol::property_mint_operation,
(issuer)(to)(location)(area)(category)
)

FC_REFLECT( estate::protocol::property_set_manager_operation,
(owner)(property)(manager)
)

FC_REFLECT( estate::protocol::property_list_for_sale_operation,
(seller)(property)(price)
)

FC_REFLECT( estate::protocol::offer_create_operation,
(bidder)(property)(amount)
)

FC_REFLECT( estate::protocol::offer_accept_operation,
(seller)(property)(buyer)
)

FC_REFLECT( estate::protocol::offer_withdraw_operation,
(bidder)(property)
)

FC_REFLECT( estate::protocol::property_list_for_rent_operation,
(landlord)(property)(monthly_rent)
)

FC_REFLECT( estate::protocol::property_rent_operation,
(renter)(property)(months)(amount)
)

FC_REFLECT( estate::protocol::rental_extend_operation,
(renter)(property)(additional_months)(amount)
)

FC_REFLECT( estate::protocol::auction_start_operation,
(seller)(property)(start_price)(duration)
)

FC_REFLECT( estate::protocol::auction_bid_operation,
(bidder)(property)(amount)
)

FC_REFLECT( estate::protocol::auction_end_operation,
(closer)(property)
)

FC_REFLECT( estate::protocol::transfer_operation,
(from)(to)(amount)
)
