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

#include <estate/chain/evaluator.hpp>
#include <estate/chain/estate_object.hpp>
#include <estate/protocol/estate.hpp>

namespace estate {
   namespace chain {

      class property_mint_evaluator : public evaluator<property_mint_evaluator> {
      public:
         typedef property_mint_operation operation_type;

         void_result do_evaluate(const property_mint_operation &o);

         property_id_type do_apply(const property_mint_operation &o);
      };

      class property_set_manager_evaluator : public evaluator<property_set_manager_evaluator> {
      public:
         typedef property_set_manager_operation operation_type;

         void_result do_evaluate(const property_set_manager_operation &o);

         void_result do_apply(const property_set_manager_operation &o);

         const property_object* _property = nullptr;
      };

      class property_list_for_sale_evaluator : public evaluator<property_list_for_sale_evaluator> {
      public:
         typedef property_list_for_sale_operation operation_type;

         void_result do_evaluate(const property_list_for_sale_operation &o);

         void_result do_apply(const property_list_for_sale_operation &o);

         const property_object* _property = nullptr;
      };

      class offer_create_evaluator : public evaluator<offer_create_evaluator> {
      public:
         typedef offer_create_operation operation_type;

         void_result do_evaluate(const offer_create_operation &o);

         void_result do_apply(const offer_create_operation &o);

         const offer_escrow_object* _prior_offer = nullptr;
      };

      class offer_accept_evaluator : public evaluator<offer_accept_evaluator> {
      public:
         typedef offer_accept_operation operation_type;

         void_result do_evaluate(const offer_accept_operation &o);

         void_result do_apply(const offer_accept_operation &o);

         const property_object* _property = nullptr;
         const offer_escrow_object* _offer = nullptr;
      };

      class offer_withdraw_evaluator : public evaluator<offer_withdraw_evaluator> {
      public:
         typedef offer_withdraw_operation operation_type;

         void_result do_evaluate(const offer_withdraw_operation &o);

         void_result do_apply(const offer_withdraw_operation &o);

         const offer_escrow_object* _offer = nullptr;
      };

      class property_list_for_rent_evaluator : public evaluator<property_list_for_rent_evaluator> {
      public:
         typedef property_list_for_rent_operation operation_type;

         void_result do_evaluate(const property_list_for_rent_operation &o);

         void_result do_apply(const property_list_for_rent_operation &o);

         const property_object* _property = nullptr;
      };

      class property_rent_evaluator : public evaluator<property_rent_evaluator> {
      public:
         typedef property_rent_operation operation_type;

         void_result do_evaluate(const property_rent_operation &o);

         void_result do_apply(const property_rent_operation &o);

         const property_object* _property = nullptr;
         share_type _required_rent;
         time_point_sec _rental_end;
      };

      class rental_extend_evaluator : public evaluator<rental_extend_evaluator> {
      public:
         typedef rental_extend_operation operation_type;

         void_result do_evaluate(const rental_extend_operation &o);

         void_result do_apply(const rental_extend_operation &o);

         const property_object* _property = nullptr;
         share_type _required_rent;
         time_point_sec _rental_end;
      };

      class auction_start_evaluator : public evaluator<auction_start_evaluator> {
      public:
         typedef auction_start_operation operation_type;

         void_result do_evaluate(const auction_start_operation &o);

         void_result do_apply(const auction_start_operation &o);

         time_point_sec _end_time;
      };

      class auction_bid_evaluator : public evaluator<auction_bid_evaluator> {
      public:
         typedef auction_bid_operation operation_type;

         void_result do_evaluate(const auction_bid_operation &o);

         void_result do_apply(const auction_bid_operation &o);

         const auction_object* _auction = nullptr;
      };

      class auction_end_evaluator : public evaluator<auction_end_evaluator> {
      public:
         typedef auction_end_operation operation_type;

         void_result do_evaluate(const auction_end_operation &o);

         void_result do_apply(const auction_end_operation &o);

         const auction_object* _auction = nullptr;
      };

      /**
       * Compute the rent owed for a term, guarding against overflow
       * @param monthly_rent Rent for one fixed-length month
       * @param months Number of months
       * @return monthly_rent * months
       */
      share_type calculate_rent(const share_type &monthly_rent, uint32_t months);

      /**
       * Compute the end of a term that starts at a given time, guarding against clock overflow
       * @param start Start of the term
       * @param seconds Length of the term in seconds
       * @return start + seconds
       */
      time_point_sec calculate_term_end(const time_point_sec &start, uint64_t seconds);

   } // namespace chain
} // namespace estate
