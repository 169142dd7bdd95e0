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

#include <fc/exception/exception.hpp>

#define ESTATE_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                          \
   if( !(expr) )                                                     \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );           \
   FC_MULTILINE_MACRO_END

namespace estate {
   namespace protocol {

      FC_DECLARE_EXCEPTION( estate_exception, 4000000 )

      /// The caller lacks the role the operation requires
      FC_DECLARE_DERIVED_EXCEPTION( authorization_error,     estate::protocol::estate_exception, 4010000 )

      /// Zero or otherwise invalid price, months, amount, or duration
      FC_DECLARE_DERIVED_EXCEPTION( invalid_argument,        estate::protocol::estate_exception, 4020000 )

      /// The property is in a commercial state that is incompatible with the operation
      FC_DECLARE_DERIVED_EXCEPTION( state_conflict,          estate::protocol::estate_exception, 4030000 )
      FC_DECLARE_DERIVED_EXCEPTION( not_for_sale,            estate::protocol::state_conflict,   4030001 )
      FC_DECLARE_DERIVED_EXCEPTION( auction_closed,          estate::protocol::state_conflict,   4030002 )
      FC_DECLARE_DERIVED_EXCEPTION( auction_not_finished,    estate::protocol::state_conflict,   4030003 )
      FC_DECLARE_DERIVED_EXCEPTION( auction_already_ended,   estate::protocol::state_conflict,   4030004 )

      /// The attached value is below the required total, or exceeds the caller's balance
      FC_DECLARE_DERIVED_EXCEPTION( insufficient_payment,    estate::protocol::estate_exception, 4040000 )
      FC_DECLARE_DERIVED_EXCEPTION( bid_too_low,             estate::protocol::insufficient_payment, 4040001 )

      /// No matching property, offer, rental listing, or auction exists
      FC_DECLARE_DERIVED_EXCEPTION( not_found,               estate::protocol::estate_exception, 4050000 )

   }
} // estate::protocol
