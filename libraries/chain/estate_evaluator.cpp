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

#include <fc/uint128.hpp>

namespace estate {
   namespace chain {

      share_type calculate_rent(const share_type &monthly_rent, uint32_t months) {
         FC_ASSERT(monthly_rent >= 0, "The monthly rent should not be negative");
         if (monthly_rent == 0 || months == 0) {
            return share_type(0);
         }

         const fc::uint128_t product = fc::uint128_t(monthly_rent.value) * months;
         ESTATE_ASSERT(product <= ESTATE_MAX_SHARE_SUPPLY, invalid_argument,
                       "Overflow when calculating the rent of ${months} months at ${rent} per month",
                       ("months", months)("rent", monthly_rent));

         return static_cast<int64_t>(product);
      }

      time_point_sec calculate_term_end(const time_point_sec &start, uint64_t seconds) {
         const uint64_t end = uint64_t(start.sec_since_epoch()) + seconds;
         ESTATE_ASSERT(end <= uint64_t(time_point_sec::maximum().sec_since_epoch()), invalid_argument,
                       "A term of ${s} seconds starting at ${start} overflows the chain clock",
                       ("s", seconds)("start", start));

         return time_point_sec(static_cast<uint32_t>(end));
      }

      void_result property_mint_evaluator::do_evaluate(const property_mint_operation &op) {
         try {
            const database& d = db();

            // Only a privileged principal may bring new properties into existence
            ESTATE_ASSERT(d.access().is_privileged(op.issuer), authorization_error,
                          "Account ${issuer} is not privileged to mint properties", ("issuer", op.issuer));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      property_id_type property_mint_evaluator::do_apply(const property_mint_operation &op) {
         try {
            database& d = db();

            // Allocate the next identifier of the sequence
            const property_id_type id = d.allocate_property_id();

            // Initialize the record with no listing, no rental, and no manager
            d.create<property_object>([&op, id](property_object& obj) {
               obj.id = id;
               obj.location = op.location;
               obj.area = op.area;
               obj.category = op.category;
            });

            // Assign the title
            d.mint_title(op.to, id);

            d.push_notification(property_minted{id, op.to, op.location});

            return id;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result property_set_manager_evaluator::do_evaluate(const property_set_manager_operation &op) {
         try {
            const database& d = db();

            // Verify the existence of the property
            _property = d.find_property(op.property);
            ESTATE_ASSERT(_property != nullptr, not_found,
                          "Property ${id} does not exist", ("id", op.property));

            // A manager cannot appoint further managers
            ESTATE_ASSERT(is_title_holder(d, op.property, op.owner), authorization_error,
                          "Only the title holder of property ${id} may set its manager",
                          ("id", op.property));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result property_set_manager_evaluator::do_apply(const property_set_manager_operation &op) {
         try {
            database& d = db();

            // Any prior manager is replaced unconditionally
            d.modify(*_property, [&op](property_object& obj) {
               obj.manager = op.manager;
            });

            d.push_notification(manager_updated{op.property, op.manager});

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   } // namespace chain
} // namespace estate
