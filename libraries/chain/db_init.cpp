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
#include <estate/chain/transfer_evaluator.hpp>

namespace estate {
   namespace chain {

      void database::initialize_evaluators() {
         _operation_evaluators.resize(operation::count());
         register_evaluator<property_mint_evaluator>();
         register_evaluator<property_set_manager_evaluator>();
         register_evaluator<property_list_for_sale_evaluator>();
         register_evaluator<offer_create_evaluator>();
         register_evaluator<offer_accept_evaluator>();
         register_evaluator<offer_withdraw_evaluator>();
         register_evaluator<property_list_for_rent_evaluator>();
         register_evaluator<property_rent_evaluator>();
         register_evaluator<rental_extend_evaluator>();
         register_evaluator<auction_start_evaluator>();
         register_evaluator<auction_bid_evaluator>();
         register_evaluator<auction_end_evaluator>();
         register_evaluator<transfer_evaluator>();
      }

   }
} // estate::chain
