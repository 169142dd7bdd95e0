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

#include <estate/protocol/types.hpp>

/**
 * @defgroup notifications Property state transitions published to external indexers
 */

namespace estate {
   namespace protocol {

      struct property_minted {
         property_id_type property = 0;
         account_id_type owner;
         string location;
      };

      struct property_listed {
         property_id_type property = 0;
         share_type price;
      };

      struct rental_listed {
         property_id_type property = 0;
         share_type monthly_rent;
      };

      struct offer_made {
         property_id_type property = 0;
         account_id_type bidder;
         share_type amount;
      };

      struct offer_accepted {
         property_id_type property = 0;
         account_id_type buyer;
         share_type amount;

         /// Title holder immediately before the sale, who received the amount
         account_id_type seller;
      };

      struct offer_withdrawn {
         property_id_type property = 0;
         account_id_type bidder;
         share_type amount;
      };

      struct property_rented {
         property_id_type property = 0;
         account_id_type renter;
         uint32_t months = 0;

         /// Value attached by the renter
         share_type total_paid;

         /// Title holder who collected the rent
         account_id_type landlord;
         share_type rent_collected;
      };

      struct rental_extended {
         property_id_type property = 0;
         uint32_t additional_months = 0;
         share_type additional_paid;

         account_id_type landlord;
         share_type rent_collected;
      };

      struct auction_started {
         property_id_type property = 0;
         auction_id_type auction = 0;
         share_type start_price;
         time_point_sec end_time;
      };

      struct auction_bid_placed {
         property_id_type property = 0;
         auction_id_type auction = 0;
         account_id_type bidder;
         share_type amount;
      };

      struct auction_ended {
         property_id_type property = 0;
         auction_id_type auction = 0;

         /// Absent when the auction closed without bids
         optional<account_id_type> winner;

         /// Zero when the auction closed without bids
         share_type amount;

         /// Title holder at settlement time
         account_id_type seller;
      };

      struct manager_updated {
         property_id_type property = 0;
         optional<account_id_type> manager;
      };

      typedef fc::static_variant<
         property_minted,
         property_listed,
         rental_listed,
         offer_made,
         offer_accepted,
         offer_withdrawn,
         property_rented,
         rental_extended,
         auction_started,
         auction_bid_placed,
         auction_ended,
         manager_updated
      > notification;

      /**
       * Collect every account named by a notification
       * @param n Notification
       * @return Accounts, possibly with duplicates removed
       */
      vector<account_id_type> notification_accounts(const notification& n);

      /**
       * Property that a notification refers to
       */
      property_id_type notification_property(const notification& n);

   }
} // estate::protocol

FC_REFLECT( estate::protocol::property_minted, (property)(owner)(location) )
FC_REFLECT( estate::protocol::property_listed, (property)(price) )
FC_REFLECT( estate::protocol::rental_listed, (property)(monthly_rent) )
FC_REFLECT( estate::protocol::offer_made, (property)(bidder)(amount) )
FC_REFLECT( estate::protocol::offer_accepted, (property)(buyer)(amount)(seller) )
FC_REFLECT( estate::protocol::offer_withdrawn, (property)(bidder)(amount) )
FC_REFLECT( estate::protocol::property_rented,
            (property)(renter)(months)(total_paid)(landlord)(rent_collected) )
FC_REFLECT( estate::protocol::rental_extended,
            (property)(additional_months)(additional_paid)(landlord)(rent_collected) )
FC_REFLECT( estate::protocol::auction_started, (property)(auction)(start_price)(end_time) )
FC_REFLECT( estate::protocol::auction_bid_placed, (property)(auction)(bidder)(amount) )
FC_REFLECT( estate::protocol::auction_ended, (property)(auction)(winner)(amount)(seller) )
FC_REFLECT( estate::protocol::manager_updated, (property)(manager) )
