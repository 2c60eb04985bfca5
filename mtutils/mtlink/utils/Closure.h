//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtlink/utils/common.h"
#include "mtlink/utils/logging.h"

#include <type_traits>
#include <utility>

namespace mtlink {

// move-only type-erased void() callable, can own promises and other move-only objects
class Closure {
  class Impl {
   public:
    Impl() = default;
    Impl(const Impl &) = delete;
    Impl &operator=(const Impl &) = delete;
    Impl(Impl &&) = delete;
    Impl &operator=(Impl &&) = delete;
    virtual ~Impl() = default;
    virtual void run() = 0;
  };

  template <class FunctionT>
  class LambdaImpl final : public Impl {
   public:
    template <class FromT>
    explicit LambdaImpl(FromT &&func) : func_(std::forward<FromT>(func)) {
    }
    void run() final {
      func_();
    }

   private:
    FunctionT func_;
  };

 public:
  Closure() = default;
  Closure(const Closure &) = delete;
  Closure &operator=(const Closure &) = delete;
  Closure(Closure &&) = default;
  Closure &operator=(Closure &&) = default;
  ~Closure() = default;

  template <class FunctionT, std::enable_if_t<!std::is_same<std::decay_t<FunctionT>, Closure>::value, int> = 0>
  Closure(FunctionT &&func)
      : impl_(make_unique<LambdaImpl<std::decay_t<FunctionT>>>(std::forward<FunctionT>(func))) {
  }

  explicit operator bool() const {
    return static_cast<bool>(impl_);
  }

  void operator()() {
    CHECK(impl_);
    impl_->run();
  }

 private:
  unique_ptr<Impl> impl_;
};

}  // namespace mtlink
