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
#include <estate/protocol/exceptions.hpp>

namespace estate {
   namespace protocol {

      FC_IMPLEMENT_EXCEPTION( estate_exception, 4000000, "estate exception" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( authorization_error,   estate_exception, 4010000,
                                      "caller is not authorized" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_argument,      estate_exception, 4020000,
                                      "invalid argument" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( state_conflict,        estate_exception, 4030000,
                                      "property state conflict" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( not_for_sale,          state_conflict,   4030001,
                                      "property is not for sale" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( auction_closed,        state_conflict,   4030002,
                                      "auction is closed" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( auction_not_finished,  state_conflict,   4030003,
                                      "auction has not reached its end time" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( auction_already_ended, state_conflict,   4030004,
                                      "auction has already ended" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_payment,  estate_exception, 4040000,
                                      "insufficient payment" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( bid_too_low,           insufficient_payment, 4040001,
                                      "bid is too low" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( not_found,             estate_exception, 4050000,
                                      "not found" )

   }
} // estate::protocol
