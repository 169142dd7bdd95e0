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

#include <estate/chain/access_control.hpp>
#include <estate/chain/estate_object.hpp>
#include <estate/chain/evaluator.hpp>
#include <estate/chain/title_registry.hpp>

#include <estate/protocol/exceptions.hpp>
#include <estate/protocol/operations.hpp>

#include <fc/signals.hpp>

#include <memory>
#include <mutex>
#include <tuple>

namespace estate {
   namespace chain {

      namespace detail {
         /**
          * Everything an operation may change.  Copied whole by an undo session.
          */
         struct chain_state {
            std::tuple<
               property_index,
               offer_escrow_index,
               auction_index,
               account_balance_index,
               notification_index
            > indices;

            title_registry titles;

            global_property_object global;
         };
      }

      /**
       *  @class database
       *  @brief Holds every property record, escrow, auction, balance and notification, and
       *  applies operations to them one at a time
       *
       *  Operations are all-or-nothing: push_operation() runs each one inside an undo session
       *  and restores the previous state if any step throws.  The chain clock is not part of that
       *  state and is never rewound.
       *
       *  push_operation(), fund_account(), set_head_time() and every query returning a copy are
       *  serialized on one mutex and may be called from any thread.  The find_*, get_index_type,
       *  get_global_properties and titles accessors return references into the live state: they are
       *  for evaluators and single-threaded callers only, and stay valid until the next operation.
       */
      class database {
      public:
         database();
         explicit database(std::shared_ptr<access_control> access);
         ~database();

         /**
          * @brief Restores the state captured when it was started unless committed
          */
         class undo_session {
         public:
            undo_session(undo_session&& mv);
            ~undo_session();

            void commit() { _apply_undo = false; }
            void undo();

         private:
            friend class database;
            explicit undo_session(database& db);

            undo_session(const undo_session&) = delete;
            undo_session& operator=(const undo_session&) = delete;

            database* _db = nullptr;
            detail::chain_state _snapshot;
            bool _apply_undo = true;
         };

         undo_session start_undo_session();

         /**
          * @brief Validate, evaluate and apply a single operation
          *
          * A receiving account may push a nested operation from a payment_received slot.
          * Notifications are published to applied_notification once the outermost operation
          * has committed.
          */
         operation_result push_operation(const operation& op);

         /// @{ Chain clock
         time_point_sec head_block_time() const;

         /// The clock never moves backwards
         void set_head_time(time_point_sec t);
         /// @}

         /**
          * @brief Issue native currency into an account outside of any operation
          */
         void fund_account(account_id_type account, share_type amount);

         /// @{ Queries
         property_object get_property(property_id_type id) const;
         const property_object* find_property(property_id_type id) const;
         bool is_rented(property_id_type id) const;
         vector<property_id_type> get_properties_for_sale() const;

         share_type get_offer(property_id_type id, account_id_type bidder) const;
         vector<offer_escrow_object> get_offers(property_id_type id) const;

         optional<account_id_type> get_manager(property_id_type id) const;

         /// Latest auction held for a property, if any
         optional<auction_object> get_auction(property_id_type id) const;
         const auction_object* find_auction(property_id_type id) const;
         vector<auction_object> get_auctions(property_id_type id) const;

         share_type get_balance(account_id_type account) const;

         vector<notification_object> get_notifications(uint64_t from_sequence, uint32_t limit) const;
         vector<notification_object> get_property_notifications(property_id_type id) const;

         const global_property_object& get_global_properties() const { return _state.global; }
         const ownership_registry& titles() const { return _state.titles; }
         const access_control& access() const { return *_access; }

         template<typename IndexType>
         const IndexType& get_index_type() const {
            return std::get<IndexType>(_state.indices);
         }
         /// @}

         /// @{ Mutation, for use by evaluators
         template<typename ObjectType, typename Constructor>
         const ObjectType& create(Constructor&& constructor) {
            auto& idx = get_mutable_index<typename index_of<ObjectType>::type>();
            ObjectType obj;
            constructor(obj);
            auto result = idx.insert(std::move(obj));
            FC_ASSERT(result.second, "Could not create object, most likely a uniqueness constraint was violated");
            return *result.first;
         }

         template<typename ObjectType, typename Modifier>
         void modify(const ObjectType& obj, const Modifier& m) {
            auto& idx = get_mutable_index<typename index_of<ObjectType>::type>();
            auto itr = idx.iterator_to(obj);
            bool ok = idx.modify(itr, m);
            FC_ASSERT(ok, "Could not modify object, most likely a uniqueness constraint was violated");
         }

         template<typename ObjectType>
         void remove(const ObjectType& obj) {
            auto& idx = get_mutable_index<typename index_of<ObjectType>::type>();
            idx.erase(idx.iterator_to(obj));
         }

         template<typename Modifier>
         void modify_global_properties(const Modifier& m) {
            m(_state.global);
         }

         property_id_type allocate_property_id();
         auction_id_type allocate_auction_id();

         void mint_title(account_id_type to, property_id_type id);
         void transfer_title(account_id_type from, account_id_type to, property_id_type id);

         /// Append a record to the notification channel
         void push_notification(const notification& n);

         void adjust_balance(account_id_type account, share_type delta);

         /// Move value attached to an operation from the caller's balance into the held funds
         void collect_payment(account_id_type from, share_type amount);
         /// @}

         /**
          *  Emitted once per notification after the operation that produced it has committed
          */
         fc::signal<void(const notification_object&)> applied_notification;

         /**
          *  Emitted after held funds are credited to an account.  A connected slot stands for the
          *  receiving account's logic; throwing from it aborts the operation that paid.
          */
         fc::signal<void(const account_id_type&, const share_type&)> payment_received;

      private:
         friend class generic_evaluator;

         operation_result apply_operation(const operation& op);

         /// Only reachable from the evaluator framework, once an operation has finished mutating state
         void push_payment(account_id_type to, share_type amount);

         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator() {
            _operation_evaluators[operation::tag<typename EvaluatorType::operation_type>::value]
               .reset(new op_evaluator_impl<EvaluatorType>());
         }

         template<typename IndexType>
         IndexType& get_mutable_index() {
            return std::get<IndexType>(_state.indices);
         }

         void publish_notifications(uint64_t first_sequence);

         detail::chain_state _state;
         time_point_sec _head_time;
         std::shared_ptr<access_control> _access;
         vector<std::unique_ptr<op_evaluator>> _operation_evaluators;

         mutable std::recursive_mutex _apply_mutex;
         uint32_t _undo_depth = 0;
      };

   }
} // estate::chain
