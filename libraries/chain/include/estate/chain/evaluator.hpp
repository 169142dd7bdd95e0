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

#include <estate/protocol/operations.hpp>

#include <memory>

namespace estate {
   namespace chain {
      using namespace estate::protocol;

      class database;

      /**
       * @brief Value owed to an account once an operation has finished mutating state
       */
      struct pending_payment {
         account_id_type to;
         share_type amount;
      };

      class generic_evaluator {
      public:
         virtual ~generic_evaluator() {}

         virtual int get_type() const = 0;

         /**
          * @brief Evaluate the operation and, when @p apply is set, apply it
          *
          * Payments scheduled by apply() are pushed only after apply() has returned, so every
          * internal mutation is complete before value leaves the system.
          */
         virtual operation_result start_evaluate(database& db, const operation& op, bool apply);

         virtual operation_result evaluate(const operation& op) = 0;
         virtual operation_result apply(const operation& op) = 0;

         database& db() const;

      protected:
         /// Debit value attached to the operation from the caller into the held funds
         void collect_payment(account_id_type from, share_type amount);

         /// Queue a push of held funds to an account
         void schedule_payment(account_id_type to, share_type amount);

         database* _db = nullptr;

      private:
         vector<pending_payment> _pending_payments;
      };

      class op_evaluator {
      public:
         virtual ~op_evaluator() {}

         virtual operation_result evaluate(database& db, const operation& op, bool apply) = 0;
      };

      template<typename T>
      class op_evaluator_impl : public op_evaluator {
      public:
         operation_result evaluate(database& db, const operation& op, bool apply = true) override {
            T eval;
            return eval.start_evaluate(db, op, apply);
         }
      };

      template<typename DerivedEvaluator>
      class evaluator : public generic_evaluator {
      public:
         int get_type() const override {
            return operation::tag<typename DerivedEvaluator::operation_type>::value;
         }

         operation_result evaluate(const operation& o) final override {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();

            return eval->do_evaluate(op);
         }

         operation_result apply(const operation& o) final override {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            const auto& op = o.get<typename DerivedEvaluator::operation_type>();

            return eval->do_apply(op);
         }
      };

   }
} // estate::chain
