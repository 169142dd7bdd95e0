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
#include <estate/chain/database.hpp>
#include <estate/chain/estate_evaluator.hpp>
#include <estate/chain/is_authorized_property.hpp>

#include <fc/log/logger.hpp>

namespace estate {
   namespace chain {

      void_result auction_start_evaluator::do_evaluate(const auction_start_operation &op) {
         try {
            const database& d = db();

            const property_object* p = d.find_property(op.property);
            ESTATE_ASSERT(p != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));

            ESTATE_ASSERT(is_authorized_for_property(d, op.property, op.seller), authorization_error,
                          "Account ${a} is neither the title holder nor the manager of property ${id}",
                          ("a", op.seller)("id", op.property));

            const auto now = d.head_block_time();
            ESTATE_ASSERT(!p->for_sale, state_conflict,
                          "Property ${id} is listed for sale", ("id", op.property));
            ESTATE_ASSERT(!p->is_rented(now), state_conflict,
                          "Property ${id} is rented until ${end}", ("id", op.property)("end", p->rental_end));

            // Only one auction of a property may be open at a time
            const auction_object* current = d.find_auction(op.property);
            ESTATE_ASSERT(current == nullptr || current->ended, state_conflict,
                          "Auction ${auction} of property ${id} has not been ended",
                          ("auction", current->id)("id", op.property));

            _end_time = calculate_term_end(now, op.duration);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_start_evaluator::do_apply(const auction_start_operation &op) {
         try {
            database& d = db();

            const auction_id_type id = d.allocate_auction_id();
            d.create<auction_object>([&op, id, this](auction_object& obj) {
               obj.id = id;
               obj.property = op.property;
               obj.start_price = op.start_price;
               obj.high_bid = 0;
               obj.end_time = _end_time;
            });

            d.push_notification(auction_started{op.property, id, op.start_price, _end_time});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_bid_evaluator::do_evaluate(const auction_bid_operation &op) {
         try {
            const database& d = db();

            _auction = d.find_auction(op.property);
            ESTATE_ASSERT(_auction != nullptr, not_found,
                          "No auction exists for property ${id}", ("id", op.property));

            const auto now = d.head_block_time();
            ESTATE_ASSERT(_auction->is_accepting_bids(now), auction_closed,
                          "Auction ${auction} of property ${id} closed at ${end}",
                          ("auction", _auction->id)("id", op.property)("end", _auction->end_time));

            ESTATE_ASSERT(op.amount > _auction->high_bid, bid_too_low,
                          "The bid of ${amount} does not exceed the high bid of ${high}",
                          ("amount", op.amount)("high", _auction->high_bid));
            ESTATE_ASSERT(op.amount >= _auction->start_price, bid_too_low,
                          "The bid of ${amount} is below the start price of ${start}",
                          ("amount", op.amount)("start", _auction->start_price));

            const share_type balance = d.get_balance(op.bidder);
            ESTATE_ASSERT(balance >= op.amount, insufficient_payment,
                          "Insufficient Balance: ${balance}, unable to bid ${amount} from account ${a}",
                          ("balance", balance)("amount", op.amount)("a", op.bidder));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_bid_evaluator::do_apply(const auction_bid_operation &op) {
         try {
            database& d = db();

            collect_payment(op.bidder, op.amount);

            const optional<account_id_type> prior_bidder = _auction->high_bidder;
            const share_type prior_bid = _auction->high_bid;

            d.modify(*_auction, [&op](auction_object& obj) {
               obj.high_bid = op.amount;
               obj.high_bidder = op.bidder;
            });

            d.push_notification(auction_bid_placed{op.property, _auction->id, op.bidder, op.amount});

            // The outbid account is refunded in full, after the new bid has been recorded
            if (prior_bidder.valid())
               schedule_payment(*prior_bidder, prior_bid);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_end_evaluator::do_evaluate(const auction_end_operation &op) {
         try {
            const database& d = db();

            _auction = d.find_auction(op.property);
            ESTATE_ASSERT(_auction != nullptr, not_found,
                          "No auction exists for property ${id}", ("id", op.property));

            ESTATE_ASSERT(d.head_block_time() >= _auction->end_time, auction_not_finished,
                          "Auction ${auction} of property ${id} runs until ${end}",
                          ("auction", _auction->id)("id", op.property)("end", _auction->end_time));
            ESTATE_ASSERT(!_auction->ended, auction_already_ended,
                          "Auction ${auction} of property ${id} has already been ended",
                          ("auction", _auction->id)("id", op.property));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result auction_end_evaluator::do_apply(const auction_end_operation &op) {
         try {
            database& d = db();

            // Mark the auction as settled before anything else
            d.modify(*_auction, [](auction_object& obj) {
               obj.ended = true;
            });

            const account_id_type seller = d.titles().owner_of(op.property);

            if (!_auction->high_bidder.valid()) {
               ilog("Auction ${auction} of property ${id} ended without bids",
                    ("auction", _auction->id)("id", op.property));
               d.push_notification(auction_ended{op.property, _auction->id, optional<account_id_type>(),
                                                 share_type(0), seller});
               return void_result();
            }

            const account_id_type winner = *_auction->high_bidder;
            const share_type amount = _auction->high_bid;

            d.transfer_title(seller, winner, op.property);

            d.push_notification(auction_ended{op.property, _auction->id, optional<account_id_type>(winner),
                                              amount, seller});

            schedule_payment(seller, amount);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   } // namespace chain
} // namespace estate
