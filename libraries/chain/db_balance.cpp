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

#include <fc/log/logger.hpp>

namespace estate {
   namespace chain {

      share_type database::get_balance(account_id_type account) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         const auto& idx = get_index_type<account_balance_index>().get<by_owner>();
         auto itr = idx.find(account);
         if (itr == idx.end())
            return share_type(0);
         return itr->balance;
      }

      void database::adjust_balance(account_id_type account, share_type delta) {
         try {
            if (delta == 0)
               return;

            const auto& idx = get_index_type<account_balance_index>().get<by_owner>();
            auto itr = idx.find(account);
            if (itr == idx.end()) {
               ESTATE_ASSERT(delta > 0, insufficient_payment,
                             "Insufficient Balance: account ${a} has no balance, unable to withdraw ${d}",
                             ("a", account)("d", -delta));
               create<account_balance_object>([&](account_balance_object& b) {
                  b.owner = account;
                  b.balance = delta;
               });
               return;
            }

            ESTATE_ASSERT(itr->balance >= -delta, insufficient_payment,
                          "Insufficient Balance: account ${a}'s balance of ${b} is less than required ${r}",
                          ("a", account)("b", itr->balance)("r", -delta));
            modify(*itr, [&delta](account_balance_object& b) {
               b.balance += delta;
            });
         } FC_CAPTURE_AND_RETHROW((account)(delta))
      }

      void database::collect_payment(account_id_type from, share_type amount) {
         FC_ASSERT(amount >= 0, "Collected payments should not be negative");
         if (amount == 0)
            return;

         adjust_balance(from, -amount);
         _state.global.held_funds += amount;
      }

      void database::push_payment(account_id_type to, share_type amount) {
         FC_ASSERT(amount >= 0, "Pushed payments should not be negative");
         if (amount == 0)
            return;

         FC_ASSERT(_state.global.held_funds >= amount,
                   "Held funds of ${held} cannot cover a payment of ${amount} to ${to}",
                   ("held", _state.global.held_funds)("amount", amount)("to", to));
         _state.global.held_funds -= amount;
         adjust_balance(to, amount);

         // The receiving account may react, including by pushing a nested operation
         payment_received(to, amount);
      }

      void database::fund_account(account_id_type account, share_type amount) {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);

         ESTATE_ASSERT(amount > 0, invalid_argument, "Funding should be positive (${amount})", ("amount", amount));
         ESTATE_ASSERT(_state.global.current_supply + amount <= ESTATE_MAX_SHARE_SUPPLY, invalid_argument,
                       "Funding of ${amount} would exceed the maximum supply", ("amount", amount));

         adjust_balance(account, amount);
         _state.global.current_supply += amount;
         ilog("Issued ${amount} to ${a}", ("amount", amount)("a", account));
      }

   }
} // estate::chain
