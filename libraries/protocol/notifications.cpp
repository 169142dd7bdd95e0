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
#include <estate/protocol/notifications.hpp>

#include <algorithm>

namespace estate {
   namespace protocol {

      namespace {
         struct notification_account_collector {
            vector<account_id_type>& accounts;

            typedef void result_type;

            void operator()(const property_minted& n) const { accounts.push_back(n.owner); }
            void operator()(const property_listed&) const {}
            void operator()(const rental_listed&) const {}
            void operator()(const offer_made& n) const { accounts.push_back(n.bidder); }
            void operator()(const offer_accepted& n) const {
               accounts.push_back(n.buyer);
               accounts.push_back(n.seller);
            }
            void operator()(const offer_withdrawn& n) const { accounts.push_back(n.bidder); }
            void operator()(const property_rented& n) const {
               accounts.push_back(n.renter);
               accounts.push_back(n.landlord);
            }
            void operator()(const rental_extended& n) const { accounts.push_back(n.landlord); }
            void operator()(const auction_started&) const {}
            void operator()(const auction_bid_placed& n) const { accounts.push_back(n.bidder); }
            void operator()(const auction_ended& n) const {
               if (n.winner.valid())
                  accounts.push_back(*n.winner);
               accounts.push_back(n.seller);
            }
            void operator()(const manager_updated& n) const {
               if (n.manager.valid())
                  accounts.push_back(*n.manager);
            }
         };

         struct notification_property_reader {
            typedef property_id_type result_type;

            template<typename T>
            property_id_type operator()(const T& n) const { return n.property; }
         };
      }

      vector<account_id_type> notification_accounts(const notification& n) {
         vector<account_id_type> accounts;
         n.visit(notification_account_collector{accounts});

         std::sort(accounts.begin(), accounts.end());
         accounts.erase(std::unique(accounts.begin(), accounts.end()), accounts.end());
         return accounts;
      }

      property_id_type notification_property(const notification& n) {
         return n.visit(notification_property_reader());
      }

   }
} // estate::protocol
