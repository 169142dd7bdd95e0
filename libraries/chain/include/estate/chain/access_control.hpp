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

#include <estate/protocol/types.hpp>

#include <set>

namespace estate {
   namespace chain {
      using namespace estate::protocol;

      /**
       * @brief Decides which accounts hold the privileged role required to mint properties
       */
      class access_control {
      public:
         virtual ~access_control() {}

         virtual bool is_privileged(account_id_type caller) const = 0;
      };

      /**
       * @brief Access control backed by an explicit set of privileged accounts
       */
      class privileged_accounts : public access_control {
      public:
         privileged_accounts() {}
         explicit privileged_accounts(std::set<account_id_type> accounts) : _accounts(std::move(accounts)) {}

         bool is_privileged(account_id_type caller) const override;

         void grant(account_id_type account);
         void revoke(account_id_type account);

      private:
         std::set<account_id_type> _accounts;
      };

   }
} // estate::chain
