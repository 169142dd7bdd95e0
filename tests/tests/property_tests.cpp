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
#include <boost/test/unit_test.hpp>

#include <estate/chain/database.hpp>
#include <estate/chain/estate_object.hpp>
#include <estate/chain/is_authorized_property.hpp>
#include <estate/chain/title_registry.hpp>

#include <fc/io/json.hpp>

#include "../common/database_fixture.hpp"

using namespace estate::chain;
using namespace estate::chain::test;

BOOST_FIXTURE_TEST_SUITE( property_tests, database_fixture )

/**
 * Minting by the privileged account yields sequential identifiers with the requested title holder
 */
BOOST_AUTO_TEST_CASE( mint_assigns_sequential_ids ) {
   try {
      ACTORS((alice)(bob));

      BOOST_TEST_MESSAGE("Minting three properties");
      const property_id_type first = mint_property(alice_id, "1 Elm Street", 80, "residential");
      const property_id_type second = mint_property(bob_id, "2 Elm Street", 450, "commercial");
      const property_id_type third = mint_property(alice_id);

      BOOST_CHECK_EQUAL(first, 1u);
      BOOST_CHECK_EQUAL(second, 2u);
      BOOST_CHECK_EQUAL(third, 3u);

      BOOST_CHECK(owner_of(first) == alice_id);
      BOOST_CHECK(owner_of(second) == bob_id);
      BOOST_CHECK(owner_of(third) == alice_id);

      BOOST_TEST_MESSAGE("Checking the initial record");
      const property_object p = db.get_property(second);
      BOOST_CHECK_EQUAL(p.id, second);
      BOOST_CHECK_EQUAL(p.location, "2 Elm Street");
      BOOST_CHECK_EQUAL(p.area, 450u);
      BOOST_CHECK_EQUAL(p.category, "commercial");
      BOOST_CHECK(!p.for_sale);
      BOOST_CHECK_EQUAL(p.sale_price.value, 0);
      BOOST_CHECK(!p.renter.valid());
      BOOST_CHECK(p.rental_end == fc::time_point_sec());
      BOOST_CHECK_EQUAL(p.monthly_rent.value, 0);
      BOOST_CHECK(!p.manager.valid());
      BOOST_CHECK(!db.is_rented(second));

      BOOST_TEST_MESSAGE("Checking the minted notification");
      const property_minted minted = last_notification<property_minted>(second);
      BOOST_CHECK_EQUAL(minted.property, second);
      BOOST_CHECK(minted.owner == bob_id);
      BOOST_CHECK_EQUAL(minted.location, "2 Elm Street");

      const vector<property_id_type> alice_properties = db.titles().properties_of(alice_id);
      BOOST_REQUIRE_EQUAL(alice_properties.size(), 2u);
      BOOST_CHECK_EQUAL(alice_properties[0], first);
      BOOST_CHECK_EQUAL(alice_properties[1], third);
   } FC_LOG_AND_RETHROW()
}

/**
 * Minting by an account without the privileged role always fails and consumes no identifier
 */
BOOST_AUTO_TEST_CASE( mint_requires_privilege ) {
   try {
      ACTORS((alice)(bob));

      BOOST_TEST_MESSAGE("Alice is attempting to mint a property");
      ESTATE_REQUIRE_THROW(push(make_mint_op(alice_id, alice_id)), authorization_error);
      REQUIRE_EXCEPTION_WITH_TEXT(push(make_mint_op(alice_id, bob_id)), "not privileged to mint");
      BOOST_CHECK(db.find_property(ESTATE_FIRST_PROPERTY_ID) == nullptr);
      BOOST_CHECK(!db.titles().is_minted(ESTATE_FIRST_PROPERTY_ID));
      BOOST_CHECK(db.get_notifications(0, 100).empty());

      BOOST_TEST_MESSAGE("Granting the privilege to Alice");
      access->grant(alice_id);
      const property_id_type id = push(make_mint_op(alice_id, bob_id)).get<property_id_type>();
      BOOST_CHECK_EQUAL(id, ESTATE_FIRST_PROPERTY_ID);
      BOOST_CHECK(owner_of(id) == bob_id);

      BOOST_TEST_MESSAGE("Revoking the privilege from Alice");
      access->revoke(alice_id);
      ESTATE_REQUIRE_THROW(push(make_mint_op(alice_id, alice_id)), authorization_error);
      BOOST_CHECK_EQUAL(mint_property(alice_id), id + 1);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( unknown_property_is_not_found ) {
   try {
      ACTORS((alice));

      ESTATE_REQUIRE_THROW(db.get_property(42), not_found);
      ESTATE_REQUIRE_THROW(db.is_rented(42), not_found);
      ESTATE_REQUIRE_THROW(db.get_manager(42), not_found);
      ESTATE_REQUIRE_THROW(owner_of(42), not_found);
      ESTATE_REQUIRE_THROW(push(make_list_for_sale_op(alice_id, 42, 100)), not_found);
      ESTATE_REQUIRE_THROW(push(make_set_manager_op(alice_id, 42, optional<account_id_type>())), not_found);
      BOOST_CHECK(db.find_property(42) == nullptr);
      BOOST_CHECK(!db.get_auction(42).valid());
      BOOST_CHECK_EQUAL(db.get_offer(42, alice_id).value, 0);
   } FC_LOG_AND_RETHROW()
}

/**
 * The manager shares the listing rights of the title holder but cannot appoint managers
 */
BOOST_AUTO_TEST_CASE( manager_delegation ) {
   try {
      ACTORS((alice)(bob)(carol));
      const property_id_type id = mint_property(alice_id);

      BOOST_TEST_MESSAGE("Bob is attempting to list Alice's property");
      ESTATE_REQUIRE_THROW(push(make_list_for_sale_op(bob_id, id, 500)), authorization_error);
      BOOST_CHECK(!is_authorized_for_property(db, id, bob_id));

      BOOST_TEST_MESSAGE("Bob is attempting to appoint himself as manager");
      ESTATE_REQUIRE_THROW(push(make_set_manager_op(bob_id, id, bob_id)), authorization_error);

      BOOST_TEST_MESSAGE("Alice appoints Bob as the manager");
      push(make_set_manager_op(alice_id, id, bob_id));
      BOOST_REQUIRE(db.get_manager(id).valid());
      BOOST_CHECK(*db.get_manager(id) == bob_id);
      BOOST_CHECK(is_authorized_for_property(db, id, bob_id));
      BOOST_CHECK(!is_title_holder(db, id, bob_id));

      const manager_updated updated = last_notification<manager_updated>(id);
      BOOST_REQUIRE(updated.manager.valid());
      BOOST_CHECK(*updated.manager == bob_id);

      BOOST_TEST_MESSAGE("Bob is attempting to appoint Carol");
      REQUIRE_EXCEPTION_WITH_TEXT(push(make_set_manager_op(bob_id, id, carol_id)), "Only the title holder");

      BOOST_TEST_MESSAGE("Bob lists the property for sale on Alice's behalf");
      push(make_list_for_sale_op(bob_id, id, 500));
      BOOST_CHECK(db.get_property(id).for_sale);
      BOOST_CHECK_EQUAL(db.get_property(id).sale_price.value, 500);

      BOOST_TEST_MESSAGE("Alice replaces Bob with Carol");
      push(make_set_manager_op(alice_id, id, carol_id));
      BOOST_CHECK(*db.get_manager(id) == carol_id);
      BOOST_CHECK(!is_authorized_for_property(db, id, bob_id));
      ESTATE_REQUIRE_THROW(push(make_list_for_sale_op(bob_id, id, 600)), authorization_error);

      BOOST_TEST_MESSAGE("Alice removes the manager");
      push(make_set_manager_op(alice_id, id, optional<account_id_type>()));
      BOOST_CHECK(!db.get_manager(id).valid());
      BOOST_CHECK(!last_notification<manager_updated>(id).manager.valid());
      ESTATE_REQUIRE_THROW(push(make_list_for_sale_op(carol_id, id, 600)), authorization_error);
      BOOST_CHECK_EQUAL(count_notifications<manager_updated>(id), 3u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( ownership_registry_rules ) {
   try {
      ACTORS((alice)(bob));
      title_registry titles;

      titles.mint(alice_id, 7);
      BOOST_CHECK(titles.is_minted(7));
      BOOST_CHECK(titles.owner_of(7) == alice_id);
      ESTATE_REQUIRE_THROW(titles.mint(bob_id, 7), state_conflict);

      BOOST_TEST_MESSAGE("Only the title holder can be the source of a transfer");
      ESTATE_REQUIRE_THROW(titles.transfer(bob_id, bob_id, 7), authorization_error);
      ESTATE_REQUIRE_THROW(titles.transfer(alice_id, bob_id, 8), not_found);

      titles.transfer(alice_id, bob_id, 7);
      BOOST_CHECK(titles.owner_of(7) == bob_id);
      BOOST_CHECK(titles.properties_of(alice_id).empty());
      BOOST_CHECK_EQUAL(titles.properties_of(bob_id).size(), 1u);
      BOOST_CHECK_EQUAL(titles.size(), 1u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( chain_clock_is_monotonic ) {
   try {
      const fc::time_point_sec start = now();
      advance_time(ESTATE_SECONDS_PER_DAY);
      BOOST_CHECK(now() == start + ESTATE_SECONDS_PER_DAY);

      ESTATE_REQUIRE_THROW(generate_blocks(start), invalid_argument);
      BOOST_CHECK(now() == start + ESTATE_SECONDS_PER_DAY);

      // Standing still is allowed
      generate_blocks(now());
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( native_transfer ) {
   try {
      ACTORS((alice)(bob));
      fund(alice_id, 1000);

      push(make_transfer_op(alice_id, bob_id, 400));
      BOOST_CHECK_EQUAL(get_balance(alice_id), 600);
      BOOST_CHECK_EQUAL(get_balance(bob_id), 400);

      REQUIRE_EXCEPTION_WITH_TEXT(push(make_transfer_op(alice_id, bob_id, 601)), "Insufficient Balance");
      ESTATE_REQUIRE_THROW(push(make_transfer_op(alice_id, bob_id, 601)), insufficient_payment);
      ESTATE_REQUIRE_THROW(push(make_transfer_op(alice_id, bob_id, 0)), invalid_argument);
      ESTATE_REQUIRE_THROW(fund(alice_id, 0), invalid_argument);
      ESTATE_REQUIRE_THROW(fund(alice_id, ESTATE_MAX_SHARE_SUPPLY), invalid_argument);

      BOOST_CHECK_EQUAL(get_balance(alice_id), 600);
      BOOST_CHECK_EQUAL(get_balance(bob_id), 400);
      BOOST_CHECK_EQUAL(db.get_global_properties().current_supply.value, 1000);

      // Transfers are not property transitions
      BOOST_CHECK(db.get_notifications(0, 100).empty());
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( operation_caller_and_validation ) {
   try {
      ACTORS((alice)(bob));

      BOOST_CHECK(operation_caller(make_offer_op(bob_id, 1, 5)) == bob_id);
      BOOST_CHECK(operation_caller(make_accept_op(alice_id, 1, bob_id)) == alice_id);
      BOOST_CHECK(operation_caller(make_mint_op(committee_account, alice_id)) == committee_account);

      operation_validate(make_list_for_rent_op(alice_id, 1, 0));
      ESTATE_REQUIRE_THROW(operation_validate(make_rent_op(bob_id, 1, 0, 0)), invalid_argument);
      ESTATE_REQUIRE_THROW(operation_validate(make_extend_op(bob_id, 1, 1, -1)), invalid_argument);
      ESTATE_REQUIRE_THROW(operation_validate(make_bid_op(bob_id, 1, -3)), invalid_argument);
   } FC_LOG_AND_RETHROW()
}

/**
 * A failed operation leaves no trace, including its identifier allocation
 */
BOOST_AUTO_TEST_CASE( undo_session_restores_state ) {
   try {
      ACTORS((alice));
      const property_id_type id = mint_property(alice_id);

      {
         auto session = db.start_undo_session();
         db.modify(*db.find_property(id), [](property_object& p) {
            p.for_sale = true;
         });
         BOOST_CHECK(db.get_property(id).for_sale);
      }
      BOOST_CHECK(!db.get_property(id).for_sale);

      {
         auto session = db.start_undo_session();
         db.allocate_property_id();
         session.commit();
      }
      BOOST_CHECK_EQUAL(db.get_global_properties().next_property_id, id + 2);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( notifications_are_sequenced ) {
   try {
      ACTORS((alice)(bob));
      const property_id_type first = mint_property(alice_id);
      advance_time(60);
      const property_id_type second = mint_property(bob_id);
      push(make_list_for_sale_op(alice_id, first, 100));

      const vector<notification_object> all = db.get_notifications(0, 100);
      BOOST_REQUIRE_EQUAL(all.size(), 3u);
      BOOST_CHECK_EQUAL(all[0].sequence, ESTATE_FIRST_NOTIFICATION_SEQUENCE);
      BOOST_CHECK_EQUAL(all[1].sequence, all[0].sequence + 1);
      BOOST_CHECK_EQUAL(all[2].sequence, all[1].sequence + 1);
      BOOST_CHECK_EQUAL(all[0].property, first);
      BOOST_CHECK_EQUAL(all[1].property, second);
      BOOST_CHECK(all[1].timestamp == all[0].timestamp + 60);

      const vector<notification_object> page = db.get_notifications(all[1].sequence, 1);
      BOOST_REQUIRE_EQUAL(page.size(), 1u);
      BOOST_CHECK_EQUAL(page[0].property, second);

      BOOST_CHECK_EQUAL(db.get_property_notifications(first).size(), 2u);

      BOOST_TEST_MESSAGE("Converting a notification to JSON");
      const std::string json = fc::json::to_string(all[2]);
      BOOST_CHECK(json.find("\"price\"") != std::string::npos);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
