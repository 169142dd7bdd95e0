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

#include <estate/protocol/notifications.hpp>
#include <estate/protocol/types.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

/**
 * @defgroup estate Real-estate objects
 */

namespace estate {
   namespace chain {
      using namespace estate::protocol;
      using boost::multi_index_container;
      using namespace boost::multi_index;

      struct by_id;

      /**
       *  @brief Tracks the listing and rental state of a single property
       *  @ingroup estate
       *
       *  One object exists per minted property and is never removed.
       *  Title is tracked separately by the ownership registry.
       */
      class property_object {
      public:
         property_id_type id = 0;

         string location;
         uint64_t area = 0;
         string category;

         /// Asking price while listed for sale; zero otherwise
         share_type sale_price;
         bool for_sale = false;

         /// Renter of record.  Never cleared when the rental expires.
         optional<account_id_type> renter;
         time_point_sec rental_end;

         /// Rent for one fixed-length month; zero when not listed for rent
         share_type monthly_rent;

         /// Delegate granted the same listing rights as the title holder
         optional<account_id_type> manager;

         /// Expiry is derived from the clock reading rather than stored
         bool is_rented(time_point_sec now) const;
      };

      struct by_for_sale;
      typedef multi_index_container<
         property_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< property_object, property_id_type, &property_object::id > >,
            ordered_unique< tag<by_for_sale>,
               composite_key<property_object,
                  member<property_object, bool, &property_object::for_sale>,
                  member<property_object, property_id_type, &property_object::id>
               >
            >
         >
      > property_index;


      /**
       *  @brief Funds held for a bidder's offer on a property
       *  @ingroup estate
       *
       *  At most one object exists per (property, bidder).  The object is removed when its offer
       *  is accepted or withdrawn.
       */
      class offer_escrow_object {
      public:
         property_id_type property = 0;
         account_id_type bidder;
         share_type amount;
      };

      struct by_property_bidder;
      struct by_bidder;
      typedef multi_index_container<
         offer_escrow_object,
         indexed_by<
            ordered_unique< tag<by_property_bidder>,
               composite_key<offer_escrow_object,
                  member<offer_escrow_object, property_id_type, &offer_escrow_object::property>,
                  member<offer_escrow_object, account_id_type, &offer_escrow_object::bidder>
               >
            >,
            ordered_unique< tag<by_bidder>,
               composite_key<offer_escrow_object,
                  member<offer_escrow_object, account_id_type, &offer_escrow_object::bidder>,
                  member<offer_escrow_object, property_id_type, &offer_escrow_object::property>
               >
            >
         >
      > offer_escrow_index;


      /**
       *  @brief A timed English auction of a property
       *  @ingroup estate
       *
       *  Auction objects are never removed.  The latest auction of a property is its current one.
       */
      class auction_object {
      public:
         auction_id_type id = 0;
         property_id_type property = 0;

         share_type start_price;
         share_type high_bid;
         optional<account_id_type> high_bidder;
         time_point_sec end_time;
         bool ended = false;

         /// Bids are accepted strictly before the end time
         bool is_accepting_bids(time_point_sec now) const { return now < end_time; }
      };

      struct by_property;
      typedef multi_index_container<
         auction_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< auction_object, auction_id_type, &auction_object::id > >,
            ordered_unique< tag<by_property>,
               composite_key<auction_object,
                  member<auction_object, property_id_type, &auction_object::property>,
                  member<auction_object, auction_id_type, &auction_object::id>
               >
            >
         >
      > auction_index;


      class account_balance_object {
      public:
         account_id_type owner;
         share_type balance;
      };

      struct by_owner;
      typedef multi_index_container<
         account_balance_object,
         indexed_by<
            ordered_unique< tag<by_owner>, member< account_balance_object, account_id_type, &account_balance_object::owner > >
         >
      > account_balance_index;


      /**
       *  @brief One record of the notification channel
       *  @ingroup estate
       *
       *  Records are appended in operation order and never modified.
       */
      class notification_object {
      public:
         uint64_t sequence = 0;
         time_point_sec timestamp;
         property_id_type property = 0;
         notification event;
      };

      struct by_sequence;
      typedef multi_index_container<
         notification_object,
         indexed_by<
            ordered_unique< tag<by_sequence>, member< notification_object, uint64_t, &notification_object::sequence > >,
            ordered_unique< tag<by_property>,
               composite_key<notification_object,
                  member<notification_object, property_id_type, &notification_object::property>,
                  member<notification_object, uint64_t, &notification_object::sequence>
               >
            >
         >
      > notification_index;


      /**
       *  @brief Chain-wide counters and fund totals
       *  @ingroup estate
       */
      class global_property_object {
      public:
         property_id_type next_property_id = ESTATE_FIRST_PROPERTY_ID;
         auction_id_type next_auction_id = ESTATE_FIRST_AUCTION_ID;
         uint64_t next_notification_sequence = ESTATE_FIRST_NOTIFICATION_SEQUENCE;

         /// Native currency held by the system on behalf of bidders and renters
         share_type held_funds;

         /// Rental overpayments accepted above the required rent
         share_type retained_overpayments;

         /// Earlier offers overwritten by a later offer from the same bidder
         share_type stranded_offer_funds;

         /// Native currency issued into the ledger
         share_type current_supply;
      };

      /// Maps an object type to the index that stores it
      template<typename ObjectType> struct index_of;
      template<> struct index_of<property_object>        { typedef property_index type; };
      template<> struct index_of<offer_escrow_object>    { typedef offer_escrow_index type; };
      template<> struct index_of<auction_object>         { typedef auction_index type; };
      template<> struct index_of<account_balance_object> { typedef account_balance_index type; };
      template<> struct index_of<notification_object>    { typedef notification_index type; };
   }
} // estate::chain

FC_REFLECT( estate::chain::property_object,
            (id)
            (location)
            (area)
            (category)
            (sale_price)
            (for_sale)
            (renter)
            (rental_end)
            (monthly_rent)
            (manager)
          )

FC_REFLECT( estate::chain::offer_escrow_object, (property)(bidder)(amount) )

FC_REFLECT( estate::chain::auction_object,
            (id)
            (property)
            (start_price)
            (high_bid)
            (high_bidder)
            (end_time)
            (ended)
          )

FC_REFLECT( estate::chain::account_balance_object, (owner)(balance) )

FC_REFLECT( estate::chain::notification_object, (sequence)(timestamp)(property)(event) )

FC_REFLECT( estate::chain::global_property_object,
            (next_property_id)
            (next_auction_id)
            (next_notification_sequence)
            (held_funds)
            (retained_overpayments)
            (stranded_offer_funds)
            (current_supply)
          )
