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

#define ESTATE_SECONDS_PER_DAY                    (24*60*60)
/// Rental terms are counted in fixed-length months rather than calendar months
#define ESTATE_DAYS_PER_RENTAL_MONTH              30
#define ESTATE_SECONDS_PER_RENTAL_MONTH           (ESTATE_DAYS_PER_RENTAL_MONTH * ESTATE_SECONDS_PER_DAY)

/// Property identifiers are allocated sequentially from this value
#define ESTATE_FIRST_PROPERTY_ID                  1
#define ESTATE_FIRST_AUCTION_ID                   1
#define ESTATE_FIRST_NOTIFICATION_SEQUENCE        1

/// Upper bound on the amount of native currency that may ever be issued into the ledger
#define ESTATE_MAX_SHARE_SUPPLY                   int64_t(1000000000000000ll)

/// Depth used when converting chain objects to variants (logging, JSON)
#define ESTATE_MAX_NESTED_OBJECTS                 (200)

#define ESTATE_COMMITTEE_ACCOUNT                  (estate::protocol::account_id_type(0))
