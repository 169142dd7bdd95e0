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

      void_result property_list_for_sale_evaluator::do_evaluate(const property_list_for_sale_operation &op) {
         try {
            const database& d = db();

            // Verify the existence of the property
            _property = d.find_property(op.property);
            ESTATE_ASSERT(_property != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));

            // A rented property cannot be listed by anyone, so the rental is checked before the caller
            const auto now = d.head_block_time();
            ESTATE_ASSERT(!_property->is_rented(now), state_conflict,
                          "Property ${id} is rented until ${end}",
                          ("id", op.property)("end", _property->rental_end));

            ESTATE_ASSERT(is_authorized_for_property(d, op.property, op.seller), authorization_error,
                          "Account ${a} is neither the title holder nor the manager of property ${id}",
                          ("a", op.seller)("id", op.property));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result property_list_for_sale_evaluator::do_apply(const property_list_for_sale_operation &op) {
         try {
            database& d = db();

            // Relisting only updates the asking price
            d.modify(*_property, [&op](property_object& obj) {
               obj.for_sale = true;
               obj.sale_price = op.price;
            });

            d.push_notification(property_listed{op.property, op.price});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result offer_create_evaluator::do_evaluate(const offer_create_operation &op) {
         try {
            const database& d = db();

            const property_object* p = d.find_property(op.property);
            ESTATE_ASSERT(p != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));
            ESTATE_ASSERT(p->for_sale, not_for_sale,
                          "Property ${id} is not for sale", ("id", op.property));

            // The offer is held in escrow so the bidder must be able to cover it
            const share_type balance = d.get_balance(op.bidder);
            ESTATE_ASSERT(balance >= op.amount, insufficient_payment,
                          "Insufficient Balance: ${balance}, unable to offer ${amount} from account ${a}",
                          ("balance", balance)("amount", op.amount)("a", op.bidder));

            const auto& escrow_idx = d.get_index_type<offer_escrow_index>().get<by_property_bidder>();
            auto escrow_itr = escrow_idx.find(boost::make_tuple(op.property, op.bidder));
            if (escrow_itr != escrow_idx.end())
               _prior_offer = &*escrow_itr;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result offer_create_evaluator::do_apply(const offer_create_operation &op) {
         try {
            database& d = db();

            collect_payment(op.bidder, op.amount);

            if (_prior_offer == nullptr) {
               d.create<offer_escrow_object>([&op](offer_escrow_object& obj) {
                  obj.property = op.property;
                  obj.bidder = op.bidder;
                  obj.amount = op.amount;
               });
            } else {
               // The later offer replaces the earlier one.  The earlier amount stays held but is
               // no longer attributable to the bidder.
               const share_type stranded = _prior_offer->amount;
               wlog("Offer of ${amount} by ${bidder} on property ${id} was overwritten and is now unrecoverable",
                    ("amount", stranded)("bidder", op.bidder)("id", op.property));

               d.modify_global_properties([&stranded](global_property_object& gpo) {
                  gpo.stranded_offer_funds += stranded;
               });
               d.modify(*_prior_offer, [&op](offer_escrow_object& obj) {
                  obj.amount = op.amount;
               });
            }

            d.push_notification(offer_made{op.property, op.bidder, op.amount});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result offer_accept_evaluator::do_evaluate(const offer_accept_operation &op) {
         try {
            const database& d = db();

            _property = d.find_property(op.property);
            ESTATE_ASSERT(_property != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));

            ESTATE_ASSERT(is_authorized_for_property(d, op.property, op.seller), authorization_error,
                          "Account ${a} is neither the title holder nor the manager of property ${id}",
                          ("a", op.seller)("id", op.property));

            ESTATE_ASSERT(_property->for_sale, not_for_sale,
                          "Property ${id} is not for sale", ("id", op.property));

            const auto& escrow_idx = d.get_index_type<offer_escrow_index>().get<by_property_bidder>();
            auto escrow_itr = escrow_idx.find(boost::make_tuple(op.property, op.buyer));
            ESTATE_ASSERT(escrow_itr != escrow_idx.end() && escrow_itr->amount > 0, not_found,
                          "No offer from ${buyer} exists for property ${id}",
                          ("buyer", op.buyer)("id", op.property));
            _offer = &*escrow_itr;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result offer_accept_evaluator::do_apply(const offer_accept_operation &op) {
         try {
            database& d = db();

            const share_type amount = _offer->amount;

            // Close the listing
            d.modify(*_property, [](property_object& obj) {
               obj.for_sale = false;
               obj.sale_price = 0;
            });

            // Consume the buyer's escrow.  Offers by other bidders are untouched.
            d.remove(*_offer);
            _offer = nullptr;

            // The proceeds belong to whoever held the title before the sale
            const account_id_type seller = d.titles().owner_of(op.property);
            d.transfer_title(seller, op.buyer, op.property);

            d.push_notification(offer_accepted{op.property, op.buyer, amount, seller});

            schedule_payment(seller, amount);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result offer_withdraw_evaluator::do_evaluate(const offer_withdraw_operation &op) {
         try {
            const database& d = db();

            const auto& escrow_idx = d.get_index_type<offer_escrow_index>().get<by_property_bidder>();
            auto escrow_itr = escrow_idx.find(boost::make_tuple(op.property, op.bidder));
            ESTATE_ASSERT(escrow_itr != escrow_idx.end() && escrow_itr->amount > 0, not_found,
                          "No offer from ${bidder} exists for property ${id}",
                          ("bidder", op.bidder)("id", op.property));
            _offer = &*escrow_itr;

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result offer_withdraw_evaluator::do_apply(const offer_withdraw_operation &op) {
         try {
            database& d = db();

            const share_type amount = _offer->amount;
            d.remove(*_offer);
            _offer = nullptr;

            d.push_notification(offer_withdrawn{op.property, op.bidder, amount});

            schedule_payment(op.bidder, amount);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   } // namespace chain
} // namespace estate
