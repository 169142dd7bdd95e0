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

#include <iterator>

namespace estate {
   namespace chain {

      database::database()
         : database(std::make_shared<privileged_accounts>()) {
      }

      database::database(std::shared_ptr<access_control> access)
         : _access(std::move(access)) {
         FC_ASSERT(_access, "The database requires an access control policy");
         initialize_evaluators();
      }

      database::~database() {
      }

      database::undo_session::undo_session(database& db)
         : _db(&db), _snapshot(db._state) {
         ++_db->_undo_depth;
      }

      database::undo_session::undo_session(undo_session&& mv)
         : _db(mv._db), _snapshot(std::move(mv._snapshot)), _apply_undo(mv._apply_undo) {
         mv._db = nullptr;
         mv._apply_undo = false;
      }

      database::undo_session::~undo_session() {
         if (_db == nullptr)
            return;
         if (_apply_undo)
            _db->_state = std::move(_snapshot);
         --_db->_undo_depth;
      }

      void database::undo_session::undo() {
         FC_ASSERT(_db != nullptr && _apply_undo, "The undo session is no longer active");
         _db->_state = _snapshot;
      }

      database::undo_session database::start_undo_session() {
         return undo_session(*this);
      }

      operation_result database::push_operation(const operation& op) {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);

         const bool is_outermost = (_undo_depth == 0);
         const uint64_t first_sequence = _state.global.next_notification_sequence;

         operation_result result;
         try {
            operation_validate(op);

            auto session = start_undo_session();
            result = apply_operation(op);
            session.commit();
         } FC_CAPTURE_AND_RETHROW((op))

         if (is_outermost)
            publish_notifications(first_sequence);

         return result;
      }

      operation_result database::apply_operation(const operation& op) {
         int i_which = op.which();
         uint64_t u_which = uint64_t(i_which);
         FC_ASSERT(i_which >= 0 && u_which < _operation_evaluators.size(), "Invalid operation");
         std::unique_ptr<op_evaluator>& eval = _operation_evaluators[u_which];
         FC_ASSERT(eval, "No registered evaluator for this operation");

         dlog("Applying operation ${which} on behalf of ${caller}", ("which", i_which)("caller", operation_caller(op)));

         return eval->evaluate(*this, op, true);
      }

      void database::publish_notifications(uint64_t first_sequence) {
         const auto& idx = get_index_type<notification_index>().get<by_sequence>();
         vector<notification_object> published(idx.lower_bound(first_sequence), idx.end());
         for (const notification_object& n : published) {
            applied_notification(n);
         }
      }

      time_point_sec database::head_block_time() const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         return _head_time;
      }

      void database::set_head_time(time_point_sec t) {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         ESTATE_ASSERT(t >= _head_time, invalid_argument,
                       "The chain clock cannot move backwards from ${now} to ${t}",
                       ("now", _head_time)("t", t));
         _head_time = t;
      }

      property_id_type database::allocate_property_id() {
         return _state.global.next_property_id++;
      }

      auction_id_type database::allocate_auction_id() {
         return _state.global.next_auction_id++;
      }

      void database::mint_title(account_id_type to, property_id_type id) {
         _state.titles.mint(to, id);
      }

      void database::transfer_title(account_id_type from, account_id_type to, property_id_type id) {
         _state.titles.transfer(from, to, id);
         dlog("Title of property ${id} transferred from ${from} to ${to}", ("id", id)("from", from)("to", to));
      }

      void database::push_notification(const notification& n) {
         const uint64_t sequence = _state.global.next_notification_sequence++;
         const time_point_sec now = head_block_time();
         create<notification_object>([&](notification_object& obj) {
            obj.sequence = sequence;
            obj.timestamp = now;
            obj.property = notification_property(n);
            obj.event = n;
         });
      }

      property_object database::get_property(property_id_type id) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         const property_object* p = find_property(id);
         ESTATE_ASSERT(p != nullptr, not_found, "Property ${id} does not exist", ("id", id));
         return *p;
      }

      const property_object* database::find_property(property_id_type id) const {
         const auto& idx = get_index_type<property_index>().get<by_id>();
         auto itr = idx.find(id);
         if (itr == idx.end())
            return nullptr;
         return &*itr;
      }

      bool database::is_rented(property_id_type id) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         return get_property(id).is_rented(head_block_time());
      }

      vector<property_id_type> database::get_properties_for_sale() const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         vector<property_id_type> result;
         const auto& idx = get_index_type<property_index>().get<by_for_sale>();
         auto range = idx.equal_range(boost::make_tuple(true));
         for (auto itr = range.first; itr != range.second; ++itr)
            result.push_back(itr->id);
         return result;
      }

      share_type database::get_offer(property_id_type id, account_id_type bidder) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         const auto& idx = get_index_type<offer_escrow_index>().get<by_property_bidder>();
         auto itr = idx.find(boost::make_tuple(id, bidder));
         if (itr == idx.end())
            return share_type(0);
         return itr->amount;
      }

      vector<offer_escrow_object> database::get_offers(property_id_type id) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         const auto& idx = get_index_type<offer_escrow_index>().get<by_property_bidder>();
         auto range = idx.equal_range(boost::make_tuple(id));
         return vector<offer_escrow_object>(range.first, range.second);
      }

      optional<account_id_type> database::get_manager(property_id_type id) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         return get_property(id).manager;
      }

      const auction_object* database::find_auction(property_id_type id) const {
         const auto& idx = get_index_type<auction_index>().get<by_property>();
         auto range = idx.equal_range(boost::make_tuple(id));
         if (range.first == range.second)
            return nullptr;
         return &*std::prev(range.second);
      }

      optional<auction_object> database::get_auction(property_id_type id) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         optional<auction_object> result;
         const auction_object* a = find_auction(id);
         if (a != nullptr)
            result = *a;
         return result;
      }

      vector<auction_object> database::get_auctions(property_id_type id) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         const auto& idx = get_index_type<auction_index>().get<by_property>();
         auto range = idx.equal_range(boost::make_tuple(id));
         return vector<auction_object>(range.first, range.second);
      }

      vector<notification_object> database::get_notifications(uint64_t from_sequence, uint32_t limit) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         vector<notification_object> result;
         const auto& idx = get_index_type<notification_index>().get<by_sequence>();
         for (auto itr = idx.lower_bound(from_sequence); itr != idx.end() && result.size() < limit; ++itr)
            result.push_back(*itr);
         return result;
      }

      vector<notification_object> database::get_property_notifications(property_id_type id) const {
         std::lock_guard<std::recursive_mutex> guard(_apply_mutex);
         const auto& idx = get_index_type<notification_index>().get<by_property>();
         auto range = idx.equal_range(boost::make_tuple(id));
         return vector<notification_object>(range.first, range.second);
      }

   }
} // estate::chain
