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
#include <estate/estate_history/estate_history.hpp>

#include <fc/log/logger.hpp>

#include <set>
#include <string>

namespace estate {
   namespace estate_history {

      namespace detail {

         class estate_history_impl {
         public:
            explicit estate_history_impl(estate_history &_plugin);

            virtual ~estate_history_impl();

            void on_notification(const notification_object &n);

            friend class estate::estate_history::estate_history;

            bool is_tracked(const account_id_type &account) const;

            void add_notification(const notification_object &n);

            void add_activity(const account_id_type &account, const notification_object &n);

            void add_proceeds(const account_id_type &recipient, const share_type &amount,
                              const notification_object &n);

            vector<notification_object> get_account_history(const account_id_type account,
                                                             const fc::time_point_sec start,
                                                             const fc::time_point_sec end) const;

            vector<notification_object> get_property_history(const property_id_type id,
                                                             const fc::time_point_sec start,
                                                             const fc::time_point_sec end) const;

            share_type get_proceeds(const account_id_type account,
                                    const fc::time_point_sec start,
                                    const fc::time_point_sec end) const;

         private:
            estate_history &_self;

            /// Empty when every account is indexed
            std::set<account_id_type> _tracked_accounts;

            /// Zero keeps every activity entry
            uint32_t _max_per_account = 0;

            /// Zero keeps every notification
            uint32_t _max_per_property = 0;

            boost::signals2::scoped_connection _applied_notification_connection;

            account_activity_index _activity;
            proceeds_index _proceeds;
            property_history_index _notifications;
         };

         struct notification_process_proceeds {
            const notification_object &_n;
            estate_history_impl &_impl;

            notification_process_proceeds(const notification_object &n, estate_history_impl &history_impl)
               : _n(n), _impl(history_impl) {
            }

            typedef void result_type;

            /** do nothing for other notification types */
            template<typename T>
            void operator()( const T& )const{}

            void operator()( const offer_accepted& e ) const {
               _impl.add_proceeds(e.seller, e.amount, _n);
            }

            void operator()( const auction_ended& e ) const {
               // An auction without bids pays nobody
               if (e.winner.valid())
                  _impl.add_proceeds(e.seller, e.amount, _n);
            }

            void operator()( const property_rented& e ) const {
               _impl.add_proceeds(e.landlord, e.rent_collected, _n);
            }

            void operator()( const rental_extended& e ) const {
               _impl.add_proceeds(e.landlord, e.rent_collected, _n);
            }
         };

         void estate_history_impl::on_notification(const notification_object &n) {
            try {
               add_notification(n);

               for (const account_id_type &account : notification_accounts(n.event)) {
                  add_activity(account, n);
               }

               n.event.visit(notification_process_proceeds(n, *this));
            } FC_CAPTURE_AND_LOG( (n) )
         }

         estate_history_impl::estate_history_impl(estate_history &_plugin) :
            _self(_plugin) {
         }

         estate_history_impl::~estate_history_impl() {
         }

         bool estate_history_impl::is_tracked(const account_id_type &account) const {
            return _tracked_accounts.empty() || _tracked_accounts.count(account) > 0;
         }

         void estate_history_impl::add_notification(const notification_object &n) {
            _notifications.insert(n);

            if (_max_per_property == 0)
               return;

            // Prune the oldest notifications of the property, with the activity that refers to them
            auto &idx = _notifications.get<by_property_timestamp>();
            auto range = idx.equal_range(boost::make_tuple(n.property));
            size_t count = std::distance(range.first, range.second);
            auto itr = range.first;
            auto &activity_idx = _activity.get<by_sequence>();
            while (count > _max_per_property) {
               activity_idx.erase(itr->sequence);
               itr = idx.erase(itr);
               --count;
            }
         }

         void estate_history_impl::add_activity(const account_id_type &account, const notification_object &n) {
            if (!is_tracked(account))
               return;

            _activity.insert(account_activity_object{account, n.timestamp, n.sequence, n.property});

            if (_max_per_account == 0)
               return;

            // Prune the oldest entries of the account beyond the limit
            auto &idx = _activity.get<by_account_timestamp>();
            auto range = idx.equal_range(boost::make_tuple(account));
            size_t count = std::distance(range.first, range.second);
            auto itr = range.first;
            while (count > _max_per_account) {
               itr = idx.erase(itr);
               --count;
            }
         }

         void estate_history_impl::add_proceeds(const account_id_type &recipient, const share_type &amount,
                                                const notification_object &n) {
            if (!is_tracked(recipient) || amount == 0)
               return;

            _proceeds.insert(proceeds_object{recipient, n.timestamp, n.sequence, n.property, amount});
         }

         vector<notification_object> estate_history_impl::get_account_history(const account_id_type account,
                                                                               const fc::time_point_sec start,
                                                                               const fc::time_point_sec end) const {
            const auto &activity_idx = _activity.get<by_account_timestamp>();
            const auto &sequence_idx = _notifications.get<by_sequence>();

            vector<notification_object> result;
            auto itr = activity_idx.lower_bound(boost::make_tuple(account, start));
            while (itr != activity_idx.end() && itr->account == account && itr->timestamp < end) {
               auto n_itr = sequence_idx.find(itr->sequence);
               FC_ASSERT(n_itr != sequence_idx.end(), "Notification ${s} is missing from the history",
                         ("s", itr->sequence));
               result.push_back(*n_itr);

               ++itr;
            }

            return result;
         }

         vector<notification_object> estate_history_impl::get_property_history(const property_id_type id,
                                                                                const fc::time_point_sec start,
                                                                                const fc::time_point_sec end) const {
            const auto &idx = _notifications.get<by_property_timestamp>();

            vector<notification_object> result;
            auto itr = idx.lower_bound(boost::make_tuple(id, start));
            while (itr != idx.end() && itr->property == id && itr->timestamp < end) {
               result.push_back(*itr);
               ++itr;
            }

            return result;
         }

         share_type estate_history_impl::get_proceeds(const account_id_type account,
                                                      const fc::time_point_sec start,
                                                      const fc::time_point_sec end) const {
            const auto &idx = _proceeds.get<by_recipient_timestamp>();

            // Loop through timespan
            share_type cumulative;
            auto itr = idx.lower_bound(boost::make_tuple(account, start));
            while (itr != idx.end() && itr->recipient == account && itr->timestamp < end) {
               cumulative += itr->amount;
               ++itr;
            }

            return cumulative;
         }

      } // end namespace detail

      estate_history::estate_history(chain::database &db) :
         plugin(db),
         my(std::make_unique<detail::estate_history_impl>(*this)) {
      }

      estate_history::~estate_history() {
         cleanup();
      }

      std::string estate_history::plugin_name() const {
         return "estate_history";
      }

      std::string estate_history::plugin_description() const {
         return "Indexes property notifications by account and records seller and landlord proceeds";
      }

      void estate_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cli.add_options()
            ("estate-history-track-account", boost::program_options::value<std::vector<std::string>>()->composing()->multitoken(),
             "Account ID to index (may specify multiple times; by default all accounts are indexed)")
            ("estate-history-max-per-account", boost::program_options::value<uint32_t>()->default_value(0),
             "Maximum number of activity entries kept per account, 0 keeps everything")
            ("estate-history-max-per-property", boost::program_options::value<uint32_t>()->default_value(0),
             "Maximum number of notifications kept per property, 0 keeps everything")
            ;
         cfg.add(cli);
      }

      void estate_history::plugin_initialize(const boost::program_options::variables_map &options) {
         try {
            my->_applied_notification_connection = database().applied_notification.connect(
               [this](const notification_object &n) {
                  my->on_notification(n);
               });

            if (options.count("estate-history-track-account") > 0) {
               const std::vector<std::string> ids = options["estate-history-track-account"].as<std::vector<std::string>>();
               for (const std::string &id : ids) {
                  my->_tracked_accounts.insert(account_id_type(std::stoull(id)));
               }
            }

            if (options.count("estate-history-max-per-account") > 0) {
               my->_max_per_account = options["estate-history-max-per-account"].as<uint32_t>();
            }

            if (options.count("estate-history-max-per-property") > 0) {
               my->_max_per_property = options["estate-history-max-per-property"].as<uint32_t>();
            }
         } FC_LOG_AND_RETHROW()
      }

      void estate_history::plugin_startup() {
         ilog("estate_history: plugin_startup() begin");
      }

      void estate_history::plugin_shutdown() {
         ilog("estate_history: plugin_shutdown() begin");
         cleanup();
      }

      void estate_history::cleanup() {
         my->_applied_notification_connection.disconnect();
      }

      vector<notification_object> estate_history::get_account_history(const account_id_type account,
                                                                      const fc::time_point_sec start,
                                                                      const fc::time_point_sec end) const {
         return my->get_account_history(account, start, end);
      }

      vector<notification_object> estate_history::get_property_history(const property_id_type id,
                                                                       const fc::time_point_sec start,
                                                                       const fc::time_point_sec end) const {
         return my->get_property_history(id, start, end);
      }

      share_type estate_history::get_proceeds(const account_id_type account,
                                              const fc::time_point_sec start,
                                              const fc::time_point_sec end) const {
         return my->get_proceeds(account, start, end);
      }

   }
}
