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
#include <estate/chain/evaluator.hpp>

namespace estate {
   namespace chain {

      database& generic_evaluator::db() const {
         return *_db;
      }

      operation_result generic_evaluator::start_evaluate(database& db, const operation& op, bool apply) {
         try {
            _db = &db;
            _pending_payments.clear();

            operation_result result = evaluate(op);
            if (!apply)
               return result;

            result = this->apply(op);

            // Internal state is final at this point; only now may value leave the system
            for (const pending_payment& p : _pending_payments) {
               db.push_payment(p.to, p.amount);
            }
            _pending_payments.clear();

            return result;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void generic_evaluator::collect_payment(account_id_type from, share_type amount) {
         db().collect_payment(from, amount);
      }

      void generic_evaluator::schedule_payment(account_id_type to, share_type amount) {
         FC_ASSERT(amount >= 0, "Scheduled payments should not be negative");
         if (amount > 0)
            _pending_payments.push_back(pending_payment{to, amount});
      }

   }
} // estate::chain
