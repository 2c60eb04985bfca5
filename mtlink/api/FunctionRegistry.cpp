//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtlink/api/FunctionRegistry.h"

#include "mtlink/api/Api.h"

#include "mtlink/utils/format.h"
#include "mtlink/utils/logging.h"
#include "mtlink/utils/tl_parsers.h"

namespace mtlink {
namespace api {

namespace {

struct FunctionInfo {
  int32 id;
  const char *name;
  object_ptr<Function> (*fetch)(TlParser &p);
};

template <class T>
object_ptr<Function> fetch_function_bare(TlParser &p) {
  return T::fetch_bare(p);
}

const FunctionInfo *get_function_info(int32 constructor_id) {
  static const FunctionInfo functions[] = {
      {SaveFilePart::ID, "upload.saveFilePart", fetch_function_bare<SaveFilePart>},
      {SaveBigFilePart::ID, "upload.saveBigFilePart", fetch_function_bare<SaveBigFilePart>},
      {UploadProfilePhoto::ID, "photos.uploadProfilePhoto", fetch_function_bare<UploadProfilePhoto>}};
  for (auto &info : functions) {
    if (info.id == constructor_id) {
      return &info;
    }
  }
  return nullptr;
}

}  // namespace

bool FunctionRegistry::is_known(int32 constructor_id) {
  return get_function_info(constructor_id) != nullptr;
}

Slice FunctionRegistry::get_function_name(int32 constructor_id) {
  auto *info = get_function_info(constructor_id);
  if (info == nullptr) {
    return Slice("unknown");
  }
  return Slice(info->name);
}

Result<object_ptr<Function>> FunctionRegistry::fetch_function(Slice message) {
  TlParser parser(message);
  auto constructor_id = parser.fetch_int();
  if (parser.get_error() != nullptr) {
    return Status::Error(400, "Request is too short");
  }
  auto *info = get_function_info(constructor_id);
  if (info == nullptr) {
    return Status::Error(400, PSLICE() << "Unknown function " << format::as_hex(constructor_id));
  }
  auto function = info->fetch(parser);
  parser.fetch_end();
  TRY_STATUS_PREFIX(parser.get_status(), PSLICE() << "Can't parse " << info->name << ": ");
  CHECK(function != nullptr);
  return std::move(function);
}

}  // namespace api
}  // namespace mtlink
