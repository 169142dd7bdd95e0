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
#include "database_fixture.hpp"

#include <exception>

namespace estate { namespace chain { namespace test {

database_fixture::database_fixture()
   : access( std::make_shared<privileged_accounts>() ),
     db( access )
{ try {
   access->grant( committee_account );
   db.set_head_time( ESTATE_TESTING_GENESIS_TIMESTAMP );
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   // If we're unwinding due to an exception, don't do any more checks.
   // This way, boost test's last checkpoint tells us approximately where the error was.
   if( !std::uncaught_exception() )
      verify_funds_invariant();
}

account_id_type database_fixture::create_account( const std::string& name )
{
   const account_id_type id( next_account_instance++ );
   BOOST_TEST_MESSAGE( "Account " << name << " is " << id.instance );
   return id;
}

void database_fixture::fund( account_id_type account, share_type amount )
{
   db.fund_account( account, amount );
}

int64_t database_fixture::get_balance( account_id_type account )const
{
   return db.get_balance( account ).value;
}

operation_result database_fixture::push( const operation& op )
{
   return db.push_operation( op );
}

void database_fixture::generate_blocks( fc::time_point_sec t )
{
   db.set_head_time( t );
}

void database_fixture::advance_time( uint32_t seconds )
{
   generate_blocks( db.head_block_time() + seconds );
}

property_id_type database_fixture::mint_property( account_id_type to,
                                                  const std::string& location,
                                                  uint64_t area,
                                                  const std::string& category )
{
   property_mint_operation op = make_mint_op( committee_account, to, location );
   op.area = area;
   op.category = category;
   return push( op ).get<property_id_type>();
}

property_mint_operation database_fixture::make_mint_op( account_id_type issuer, account_id_type to,
                                                        const std::string& location )const
{
   property_mint_operation op;
   op.issuer = issuer;
   op.to = to;
   op.location = location;
   op.area = 120;
   op.category = "residential";
   return op;
}

property_set_manager_operation database_fixture::make_set_manager_op( account_id_type owner, property_id_type id,
                                                                      optional<account_id_type> manager )const
{
   property_set_manager_operation op;
   op.owner = owner;
   op.property = id;
   op.manager = manager;
   return op;
}

property_list_for_sale_operation database_fixture::make_list_for_sale_op( account_id_type seller,
                                                                          property_id_type id,
                                                                          share_type price )const
{
   property_list_for_sale_operation op;
   op.seller = seller;
   op.property = id;
   op.price = price;
   return op;
}

offer_create_operation database_fixture::make_offer_op( account_id_type bidder, property_id_type id,
                                                        share_type amount )const
{
   offer_create_operation op;
   op.bidder = bidder;
   op.property = id;
   op.amount = amount;
   return op;
}

offer_accept_operation database_fixture::make_accept_op( account_id_type seller, property_id_type id,
                                                         account_id_type buyer )const
{
   offer_accept_operation op;
   op.seller = seller;
   op.property = id;
   op.buyer = buyer;
   return op;
}

offer_withdraw_operation database_fixture::make_withdraw_op( account_id_type bidder, property_id_type id )const
{
   offer_withdraw_operation op;
   op.bidder = bidder;
   op.property = id;
   return op;
}

property_list_for_rent_operation database_fixture::make_list_for_rent_op( account_id_type landlord,
                                                                          property_id_type id,
                                                                          share_type monthly_rent )const
{
   property_list_for_rent_operation op;
   op.landlord = landlord;
   op.property = id;
   op.monthly_rent = monthly_rent;
   return op;
}

property_rent_operation database_fixture::make_rent_op( account_id_type renter, property_id_type id,
                                                        uint32_t months, share_type amount )const
{
   property_rent_operation op;
   op.renter = renter;
   op.property = id;
   op.months = months;
   op.amount = amount;
   return op;
}

rental_extend_operation database_fixture::make_extend_op( account_id_type renter, property_id_type id,
                                                          uint32_t additional_months, share_type amount )const
{
   rental_extend_operation op;
   op.renter = renter;
   op.property = id;
   op.additional_months = additional_months;
   op.amount = amount;
   return op;
}

auction_start_operation database_fixture::make_auction_start_op( account_id_type seller, property_id_type id,
                                                                 share_type start_price, uint32_t duration )const
{
   auction_start_operation op;
   op.seller = seller;
   op.property = id;
   op.start_price = start_price;
   op.duration = duration;
   return op;
}

auction_bid_operation database_fixture::make_bid_op( account_id_type bidder, property_id_type id,
                                                     share_type amount )const
{
   auction_bid_operation op;
   op.bidder = bidder;
   op.property = id;
   op.amount = amount;
   return op;
}

auction_end_operation database_fixture::make_auction_end_op( account_id_type closer, property_id_type id )const
{
   auction_end_operation op;
   op.closer = closer;
   op.property = id;
   return op;
}

transfer_operation database_fixture::make_transfer_op( account_id_type from, account_id_type to,
                                                       share_type amount )const
{
   transfer_operation op;
   op.from = from;
   op.to = to;
   op.amount = amount;
   return op;
}

account_id_type database_fixture::owner_of( property_id_type id )const
{
   return db.titles().owner_of( id );
}

void database_fixture::verify_funds_invariant()const
{
   const global_property_object& gpo = db.get_global_properties();

   share_type total_balances;
   for( const account_balance_object& b : db.get_index_type<account_balance_index>() )
   {
      BOOST_CHECK( b.balance >= 0 );
      total_balances += b.balance;
   }
   BOOST_CHECK_EQUAL( (total_balances + gpo.held_funds).value, gpo.current_supply.value );

   share_type total_escrow;
   for( const offer_escrow_object& e : db.get_index_type<offer_escrow_index>() )
      total_escrow += e.amount;

   share_type open_bids;
   for( const auction_object& a : db.get_index_type<auction_index>() )
      if( !a.ended && a.high_bidder.valid() )
         open_bids += a.high_bid;

   BOOST_CHECK_EQUAL( gpo.held_funds.value,
                      (total_escrow + open_bids + gpo.retained_overpayments + gpo.stranded_offer_funds).value );
}

} } } // estate::chain::test
