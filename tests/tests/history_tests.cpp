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
#include <estate/estate_history/estate_history.hpp> // For testing property history

#include "../common/database_fixture.hpp"

#include <boost/program_options.hpp>

using namespace estate::chain;
using namespace estate::chain::test;

struct history_database_fixture : database_fixture {
   std::unique_ptr<estate::estate_history::estate_history> history;

   history_database_fixture()
      : database_fixture() {
   }

   // Load the history plugin with the given command-line arguments
   void start_history_plugin(const std::vector<std::string>& args = std::vector<std::string>()) {
      history.reset(new estate::estate_history::estate_history(db));

      boost::program_options::options_description cli;
      boost::program_options::options_description cfg;
      history->plugin_set_program_options(cli, cfg);

      std::vector<const char*> argv;
      argv.push_back("estate_tests");
      for (const std::string& arg : args)
         argv.push_back(arg.c_str());

      boost::program_options::variables_map options;
      boost::program_options::store(
         boost::program_options::parse_command_line(static_cast<int>(argv.size()), argv.data(), cli), options);
      boost::program_options::notify(options);

      history->plugin_initialize(options);
      history->plugin_startup();
   }

   fc::time_point_sec t0;
   property_id_type sold = 0;
   property_id_type leased = 0;
   property_id_type auctioned = 0;

   /**
    * Alice sells one property to Bob, rents one to Carol, and auctions one to Bob
    */
   void run_market(account_id_type alice_id, account_id_type bob_id, account_id_type carol_id) {
      fund(bob_id, 5000);
      fund(carol_id, 5000);
      t0 = now();

      sold = mint_property(alice_id);
      leased = mint_property(alice_id);
      auctioned = mint_property(alice_id);

      push(make_list_for_sale_op(alice_id, sold, 1000));
      push(make_offer_op(bob_id, sold, 1000));
      advance_time(100);
      push(make_accept_op(alice_id, sold, bob_id));

      advance_time(100);
      push(make_list_for_rent_op(alice_id, leased, 50));
      push(make_rent_op(carol_id, leased, 2, 100));

      advance_time(100);
      push(make_auction_start_op(alice_id, auctioned, 10, 60));
      push(make_bid_op(bob_id, auctioned, 20));
      advance_time(60);
      push(make_auction_end_op(carol_id, auctioned));
   }
};

BOOST_FIXTURE_TEST_SUITE( history_tests, history_database_fixture )

BOOST_AUTO_TEST_CASE( account_activity_and_proceeds ) {
   try {
      ACTORS((alice)(bob)(carol));
      start_history_plugin();
      BOOST_CHECK_EQUAL(history->plugin_name(), "estate_history");

      run_market(alice_id, bob_id, carol_id);
      const fc::time_point_sec end_of_time = fc::time_point_sec::maximum();

      BOOST_TEST_MESSAGE("Checking Alice's activity");
      const vector<notification_object> alice_history = history->get_account_history(alice_id, t0, end_of_time);
      BOOST_REQUIRE_EQUAL(alice_history.size(), 6u);
      BOOST_CHECK(alice_history[0].event.which() == notification::tag<property_minted>::value);
      BOOST_CHECK(alice_history[3].event.which() == notification::tag<offer_accepted>::value);
      BOOST_CHECK(alice_history[4].event.which() == notification::tag<property_rented>::value);
      BOOST_CHECK(alice_history[5].event.which() == notification::tag<auction_ended>::value);
      for (size_t i = 1; i < alice_history.size(); ++i)
         BOOST_CHECK_LT(alice_history[i - 1].sequence, alice_history[i].sequence);

      BOOST_TEST_MESSAGE("Checking Bob's activity");
      BOOST_CHECK_EQUAL(history->get_account_history(bob_id, t0, end_of_time).size(), 4u);
      BOOST_CHECK_EQUAL(history->get_account_history(bob_id, t0 + 100, t0 + 300).size(), 1u);

      BOOST_TEST_MESSAGE("Checking the proceeds; the end of the window is exclusive");
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, t0, end_of_time).value, 1120);
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, t0 + 100, t0 + 200).value, 1000);
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, t0 + 200, t0 + 360).value, 100);
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, t0 + 200, t0 + 361).value, 120);
      BOOST_CHECK_EQUAL(history->get_proceeds(bob_id, t0, end_of_time).value, 0);
      BOOST_CHECK_EQUAL(history->get_proceeds(carol_id, t0, end_of_time).value, 0);

      BOOST_TEST_MESSAGE("Checking the property history");
      BOOST_CHECK_EQUAL(history->get_property_history(sold, t0, end_of_time).size(), 4u);
      const vector<notification_object> after_sale = history->get_property_history(sold, t0 + 100, end_of_time);
      BOOST_REQUIRE_EQUAL(after_sale.size(), 1u);
      BOOST_CHECK(after_sale[0].event.which() == notification::tag<offer_accepted>::value);
      BOOST_CHECK_EQUAL(history->get_property_history(auctioned, t0, end_of_time).size(), 4u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( tracked_accounts_only ) {
   try {
      ACTORS((alice)(bob)(carol));
      start_history_plugin({"--estate-history-track-account", std::to_string(alice_id.instance)});

      run_market(alice_id, bob_id, carol_id);
      const fc::time_point_sec end_of_time = fc::time_point_sec::maximum();

      BOOST_CHECK_EQUAL(history->get_account_history(alice_id, t0, end_of_time).size(), 6u);
      BOOST_CHECK(history->get_account_history(bob_id, t0, end_of_time).empty());
      BOOST_CHECK(history->get_account_history(carol_id, t0, end_of_time).empty());
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, t0, end_of_time).value, 1120);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( activity_is_pruned_per_account ) {
   try {
      ACTORS((alice)(bob)(carol));
      start_history_plugin({"--estate-history-max-per-account", "2"});

      run_market(alice_id, bob_id, carol_id);
      const fc::time_point_sec end_of_time = fc::time_point_sec::maximum();

      const vector<notification_object> alice_history = history->get_account_history(alice_id, t0, end_of_time);
      BOOST_REQUIRE_EQUAL(alice_history.size(), 2u);
      BOOST_CHECK(alice_history[0].event.which() == notification::tag<property_rented>::value);
      BOOST_CHECK(alice_history[1].event.which() == notification::tag<auction_ended>::value);

      // Property history and proceeds are not pruned
      BOOST_CHECK_EQUAL(history->get_property_history(sold, t0, end_of_time).size(), 4u);
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, t0, end_of_time).value, 1120);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( notifications_are_pruned_per_property ) {
   try {
      ACTORS((alice)(bob)(carol));
      start_history_plugin({"--estate-history-max-per-property", "2"});

      run_market(alice_id, bob_id, carol_id);
      const fc::time_point_sec end_of_time = fc::time_point_sec::maximum();

      BOOST_TEST_MESSAGE("Only the latest two notifications of each property are kept");
      const vector<notification_object> sold_history = history->get_property_history(sold, t0, end_of_time);
      BOOST_REQUIRE_EQUAL(sold_history.size(), 2u);
      BOOST_CHECK(sold_history[0].event.which() == notification::tag<offer_made>::value);
      BOOST_CHECK(sold_history[1].event.which() == notification::tag<offer_accepted>::value);
      BOOST_CHECK_EQUAL(history->get_property_history(leased, t0, end_of_time).size(), 2u);
      BOOST_CHECK_EQUAL(history->get_property_history(auctioned, t0, end_of_time).size(), 2u);

      BOOST_TEST_MESSAGE("Activity referring to a pruned notification is dropped with it");
      const vector<notification_object> alice_history = history->get_account_history(alice_id, t0, end_of_time);
      BOOST_REQUIRE_EQUAL(alice_history.size(), 3u);
      BOOST_CHECK(alice_history[0].event.which() == notification::tag<offer_accepted>::value);
      BOOST_CHECK(alice_history[1].event.which() == notification::tag<property_rented>::value);
      BOOST_CHECK(alice_history[2].event.which() == notification::tag<auction_ended>::value);
      BOOST_CHECK_EQUAL(history->get_account_history(bob_id, t0, end_of_time).size(), 4u);

      // Proceeds are not pruned
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, t0, end_of_time).value, 1120);

      // The chain itself keeps every notification
      BOOST_CHECK_EQUAL(db.get_property_notifications(sold).size(), 4u);
   } FC_LOG_AND_RETHROW()
}

/**
 * Notifications of an aborted operation never reach the plugin
 */
BOOST_AUTO_TEST_CASE( aborted_operations_are_not_indexed ) {
   try {
      ACTORS((alice)(bob));
      start_history_plugin();
      fund(bob_id, 1000);
      const fc::time_point_sec start = now();
      const fc::time_point_sec end_of_time = fc::time_point_sec::maximum();

      const property_id_type id = mint_property(alice_id);
      push(make_list_for_sale_op(alice_id, id, 500));
      push(make_offer_op(bob_id, id, 500));

      {
         boost::signals2::scoped_connection c = db.payment_received.connect(
            [&](const account_id_type& to, const share_type&) {
               FC_ASSERT(to != alice_id, "Payment rejected");
            });
         ESTATE_REQUIRE_THROW(push(make_accept_op(alice_id, id, bob_id)), fc::assert_exception);
      }

      BOOST_CHECK_EQUAL(history->get_property_history(id, start, end_of_time).size(), 3u);
      BOOST_CHECK_EQUAL(history->get_account_history(alice_id, start, end_of_time).size(), 1u);
      BOOST_CHECK_EQUAL(history->get_proceeds(alice_id, start, end_of_time).value, 0);

      BOOST_TEST_MESSAGE("The plugin stops indexing after shutdown");
      history->plugin_shutdown();
      push(make_accept_op(alice_id, id, bob_id));
      BOOST_CHECK_EQUAL(history->get_property_history(id, start, end_of_time).size(), 3u);
      BOOST_CHECK_EQUAL(db.get_property_notifications(id).size(), 4u);
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
