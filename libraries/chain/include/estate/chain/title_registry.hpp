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

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace estate {
   namespace chain {
      using namespace estate::protocol;

      /**
       * @brief Ledger of title to properties
       *
       * Title is assigned once at mint and afterwards changes only by transfer.
       */
      class ownership_registry {
      public:
         virtual ~ownership_registry() {}

         /**
          * @brief Current title holder of a property
          * @throws not_found if the property was never minted
          */
         virtual account_id_type owner_of(property_id_type id) const = 0;

         virtual bool is_minted(property_id_type id) const = 0;

         /**
          * @brief Properties titled to an account, in ascending identifier order
          */
         virtual vector<property_id_type> properties_of(account_id_type owner) const = 0;

         /**
          * @brief Assign title of a newly minted property
          * @throws state_conflict if the property already has a title holder
          */
         virtual void mint(account_id_type to, property_id_type id) = 0;

         /**
          * @brief Move title between accounts
          * @throws authorization_error if @p from is not the title holder
          */
         virtual void transfer(account_id_type from, account_id_type to, property_id_type id) = 0;
      };

      struct title_object {
         property_id_type property = 0;
         account_id_type owner;
      };

      struct by_title_property;
      struct by_title_owner;
      typedef boost::multi_index_container<
         title_object,
         boost::multi_index::indexed_by<
            boost::multi_index::ordered_unique< boost::multi_index::tag<by_title_property>,
               boost::multi_index::member<title_object, property_id_type, &title_object::property>
            >,
            boost::multi_index::ordered_unique< boost::multi_index::tag<by_title_owner>,
               boost::multi_index::composite_key<title_object,
                  boost::multi_index::member<title_object, account_id_type, &title_object::owner>,
                  boost::multi_index::member<title_object, property_id_type, &title_object::property>
               >
            >
         >
      > title_index;

      /**
       * @brief In-process ownership registry
       *
       * Instances are copyable so that the database can snapshot title along with the rest of its
       * state and restore it when an operation aborts.
       */
      class title_registry : public ownership_registry {
      public:
         account_id_type owner_of(property_id_type id) const override;
         bool is_minted(property_id_type id) const override;
         vector<property_id_type> properties_of(account_id_type owner) const override;

         void mint(account_id_type to, property_id_type id) override;
         void transfer(account_id_type from, account_id_type to, property_id_type id) override;

         size_t size() const { return _titles.size(); }

      private:
         title_index _titles;
      };

   }
} // estate::chain

FC_REFLECT( estate::chain::title_object, (property)(owner) )
