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
#include <estate/chain/title_registry.hpp>
#include <estate/protocol/exceptions.hpp>

namespace estate {
   namespace chain {

      account_id_type title_registry::owner_of(property_id_type id) const {
         const auto& idx = _titles.get<by_title_property>();
         auto itr = idx.find(id);
         ESTATE_ASSERT(itr != idx.end(), not_found, "Property ${id} has not been minted", ("id", id));
         return itr->owner;
      }

      bool title_registry::is_minted(property_id_type id) const {
         const auto& idx = _titles.get<by_title_property>();
         return idx.find(id) != idx.end();
      }

      vector<property_id_type> title_registry::properties_of(account_id_type owner) const {
         vector<property_id_type> result;
         const auto& idx = _titles.get<by_title_owner>();
         auto range = idx.equal_range(boost::make_tuple(owner));
         for (auto itr = range.first; itr != range.second; ++itr) {
            result.push_back(itr->property);
         }
         return result;
      }

      void title_registry::mint(account_id_type to, property_id_type id) {
         ESTATE_ASSERT(!is_minted(id), state_conflict,
                       "Property ${id} already has a title holder", ("id", id));
         title_object t;
         t.property = id;
         t.owner = to;
         _titles.insert(t);
      }

      void title_registry::transfer(account_id_type from, account_id_type to, property_id_type id) {
         auto& idx = _titles.get<by_title_property>();
         auto itr = idx.find(id);
         ESTATE_ASSERT(itr != idx.end(), not_found, "Property ${id} has not been minted", ("id", id));
         ESTATE_ASSERT(itr->owner == from, authorization_error,
                       "Title of property ${id} is held by ${holder} rather than ${from}",
                       ("id", id)("holder", itr->owner)("from", from));
         idx.modify(itr, [&to](title_object& t) {
            t.owner = to;
         });
      }

   }
} // estate::chain
