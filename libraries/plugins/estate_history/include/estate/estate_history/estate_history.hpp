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

#include <estate/app/plugin.hpp>
#include <estate/chain/database.hpp>

#include <memory>

namespace estate { namespace estate_history {
using namespace chain;

/**
 * An account named by a notification, as seen by the history index
 */
struct account_activity_object
{
   account_id_type account;
   fc::time_point_sec timestamp;
   uint64_t sequence = 0;
   property_id_type property = 0;
};

/**
 * Native currency paid to a seller or landlord by a sale, an auction settlement, or rent
 */
struct proceeds_object
{
   account_id_type recipient;
   fc::time_point_sec timestamp;
   uint64_t sequence = 0;
   property_id_type property = 0;
   share_type amount;
};

struct by_account_timestamp;
typedef multi_index_container<
   account_activity_object,
   indexed_by<
      ordered_unique< tag<by_account_timestamp>,
         composite_key< account_activity_object,
            member< account_activity_object, account_id_type, &account_activity_object::account >,
            member< account_activity_object, fc::time_point_sec, &account_activity_object::timestamp >,
            member< account_activity_object, uint64_t, &account_activity_object::sequence >
         >
      >,
      ordered_non_unique< tag<by_sequence>, member< account_activity_object, uint64_t, &account_activity_object::sequence > >
   >
> account_activity_index;

struct by_recipient_timestamp;
typedef multi_index_container<
   proceeds_object,
   indexed_by<
      ordered_unique< tag<by_recipient_timestamp>,
         composite_key< proceeds_object,
            member< proceeds_object, account_id_type, &proceeds_object::recipient >,
            member< proceeds_object, fc::time_point_sec, &proceeds_object::timestamp >,
            member< proceeds_object, uint64_t, &proceeds_object::sequence >
         >
      >
   >
> proceeds_index;

struct by_property_timestamp;
typedef multi_index_container<
   notification_object,
   indexed_by<
      ordered_unique< tag<by_sequence>, member< notification_object, uint64_t, &notification_object::sequence > >,
      ordered_unique< tag<by_property_timestamp>,
         composite_key< notification_object,
            member< notification_object, property_id_type, &notification_object::property >,
            member< notification_object, fc::time_point_sec, &notification_object::timestamp >,
            member< notification_object, uint64_t, &notification_object::sequence >
         >
      >
   >
> property_history_index;

namespace detail
{
    class estate_history_impl;
}

/**
 * Indexes published notifications by account and by property, and records proceeds
 *
 * Stored notifications are bounded by estate-history-max-per-property.  Pruning a notification also
 * drops the account activity that referred to it.  Proceeds records are kept for the life of the
 * plugin.  With the default limit of 0 the property history grows with the chain.
 */
class estate_history : public estate::app::plugin
{
   public:
      explicit estate_history(chain::database& db);
      ~estate_history() override;

      std::string plugin_name()const override;
      std::string plugin_description()const override;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg) override;
      void plugin_initialize(const boost::program_options::variables_map& options) override;
      void plugin_startup() override;
      void plugin_shutdown() override;

      /**
       * @brief Get the notifications that named an account
       * @param account Account
       * @param start Start time (inclusive)
       * @param end End time (exclusive)
       * @return Notifications in the order they were published
       */
      vector<notification_object> get_account_history(const account_id_type account,
                                                       const fc::time_point_sec start,
                                                       const fc::time_point_sec end) const;

      /**
       * @brief Get the notifications of a property
       * @param id Property ID
       * @param start Start time (inclusive)
       * @param end End time (exclusive)
       * @return Notifications in the order they were published
       */
      vector<notification_object> get_property_history(const property_id_type id,
                                                       const fc::time_point_sec start,
                                                       const fc::time_point_sec end) const;

      /**
       * @brief Get the proceeds paid to an account from sales, auction settlements and rent
       * @param account Recipient
       * @param start Start time (inclusive)
       * @param end End time (exclusive)
       * @return Total proceeds
       */
      share_type get_proceeds(const account_id_type account,
                              const fc::time_point_sec start,
                              const fc::time_point_sec end) const;

   private:
      void cleanup();

      friend class detail::estate_history_impl;
      std::unique_ptr<detail::estate_history_impl> my;
};

} } //estate::estate_history

FC_REFLECT( estate::estate_history::account_activity_object, (account)(timestamp)(sequence)(property) )
FC_REFLECT( estate::estate_history::proceeds_object, (recipient)(timestamp)(sequence)(property)(amount) )
