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

namespace estate {
   namespace chain {

      void_result property_list_for_rent_evaluator::do_evaluate(const property_list_for_rent_operation &op) {
         try {
            const database& d = db();

            _property = d.find_property(op.property);
            ESTATE_ASSERT(_property != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));

            ESTATE_ASSERT(is_authorized_for_property(d, op.property, op.landlord), authorization_error,
                          "Account ${a} is neither the title holder nor the manager of property ${id}",
                          ("a", op.landlord)("id", op.property));

            ESTATE_ASSERT(!_property->for_sale, state_conflict,
                          "Property ${id} is listed for sale", ("id", op.property));
            ESTATE_ASSERT(!_property->is_rented(d.head_block_time()), state_conflict,
                          "Property ${id} is rented until ${end}",
                          ("id", op.property)("end", _property->rental_end));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result property_list_for_rent_evaluator::do_apply(const property_list_for_rent_operation &op) {
         try {
            database& d = db();

            // A monthly rent of zero withdraws the rental listing
            d.modify(*_property, [&op](property_object& obj) {
               obj.monthly_rent = op.monthly_rent;
            });

            d.push_notification(rental_listed{op.property, op.monthly_rent});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result property_rent_evaluator::do_evaluate(const property_rent_operation &op) {
         try {
            const database& d = db();

            _property = d.find_property(op.property);
            ESTATE_ASSERT(_property != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));
            ESTATE_ASSERT(_property->monthly_rent > 0, not_found,
                          "Property ${id} is not listed for rent", ("id", op.property));

            // Renting does not consult the sale listing
            const auto now = d.head_block_time();
            ESTATE_ASSERT(!_property->is_rented(now), state_conflict,
                          "Property ${id} is rented until ${end}",
                          ("id", op.property)("end", _property->rental_end));

            _required_rent = calculate_rent(_property->monthly_rent, op.months);
            ESTATE_ASSERT(op.amount >= _required_rent, insufficient_payment,
                          "The payment of ${paid} is less than the rent of ${required} for ${months} months",
                          ("paid", op.amount)("required", _required_rent)("months", op.months));

            const share_type balance = d.get_balance(op.renter);
            ESTATE_ASSERT(balance >= op.amount, insufficient_payment,
                          "Insufficient Balance: ${balance}, unable to pay ${amount} from account ${a}",
                          ("balance", balance)("amount", op.amount)("a", op.renter));

            _rental_end = calculate_term_end(now, uint64_t(op.months) * ESTATE_SECONDS_PER_RENTAL_MONTH);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result property_rent_evaluator::do_apply(const property_rent_operation &op) {
         try {
            database& d = db();

            collect_payment(op.renter, op.amount);

            d.modify(*_property, [&op, this](property_object& obj) {
               obj.renter = op.renter;
               obj.rental_end = _rental_end;
            });

            // Anything above the required rent is retained rather than refunded
            const share_type excess = op.amount - _required_rent;
            d.modify_global_properties([&excess](global_property_object& gpo) {
               gpo.retained_overpayments += excess;
            });

            const account_id_type landlord = d.titles().owner_of(op.property);
            d.push_notification(property_rented{op.property, op.renter, op.months, op.amount,
                                                landlord, _required_rent});

            schedule_payment(landlord, _required_rent);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result rental_extend_evaluator::do_evaluate(const rental_extend_operation &op) {
         try {
            const database& d = db();

            _property = d.find_property(op.property);
            ESTATE_ASSERT(_property != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));

            ESTATE_ASSERT(_property->renter.valid() && *_property->renter == op.renter, authorization_error,
                          "Account ${a} is not the renter of property ${id}",
                          ("a", op.renter)("id", op.property));

            _required_rent = calculate_rent(_property->monthly_rent, op.additional_months);
            ESTATE_ASSERT(op.amount >= _required_rent, insufficient_payment,
                          "The payment of ${paid} is less than the rent of ${required} for ${months} months",
                          ("paid", op.amount)("required", _required_rent)("months", op.additional_months));

            const share_type balance = d.get_balance(op.renter);
            ESTATE_ASSERT(balance >= op.amount, insufficient_payment,
                          "Insufficient Balance: ${balance}, unable to pay ${amount} from account ${a}",
                          ("balance", balance)("amount", op.amount)("a", op.renter));

            // The extension is added to the stored end even when the rental has already expired
            _rental_end = calculate_term_end(_property->rental_end,
                                             uint64_t(op.additional_months) * ESTATE_SECONDS_PER_RENTAL_MONTH);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result rental_extend_evaluator::do_apply(const rental_extend_operation &op) {
         try {
            database& d = db();

            collect_payment(op.renter, op.amount);

            d.modify(*_property, [this](property_object& obj) {
               obj.rental_end = _rental_end;
            });

            const share_type excess = op.amount - _required_rent;
            d.modify_global_properties([&excess](global_property_object& gpo) {
               gpo.retained_overpayments += excess;
            });

            // The rent goes to the title holder at extension time, who need not be the original landlord
            const account_id_type landlord = d.titles().owner_of(op.property);
            d.push_notification(rental_extended{op.property, op.additional_months, op.amount,
                                                landlord, _required_rent});

            schedule_payment(landlord, _required_rent);

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   } // namespace chain
} // namespace estate
