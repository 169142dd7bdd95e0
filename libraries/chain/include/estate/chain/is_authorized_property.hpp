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

#include <estate/protocol/types.hpp>

namespace estate {
   namespace chain {
      class database;

      /**
       * Determine whether an account may exercise the listing rights of a property
       * @param db Database
       * @param id Property ID
       * @param caller Account requesting the operation
       * @return True when the caller is the title holder or the property's manager
       */
      bool is_authorized_for_property(const database& db, property_id_type id, account_id_type caller);

      /**
       * Determine whether an account holds title to a property
       * @param db Database
       * @param id Property ID
       * @param caller Account requesting the operation
       * @return True only for the title holder; a manager is never the title holder
       */
      bool is_title_holder(const database& db, property_id_type id, account_id_type caller);

   }
}
