//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/api/TlObject.h"

#include "mtlink/utils/common.h"
#include "mtlink/utils/Slice.h"
#include "mtlink/utils/Status.h"

namespace mtlink {
namespace api {

// known functions by constructor identifier
class FunctionRegistry {
 public:
  static bool is_known(int32 constructor_id);

  // "unknown" for unregistered identifiers
  static Slice get_function_name(int32 constructor_id);

  // parses a boxed function, the whole message must be consumed
  static Result<object_ptr<Function>> fetch_function(Slice message) MTLINK_WARN_UNUSED_RESULT;
};

}  // namespace api
}  // namespace mtlink
