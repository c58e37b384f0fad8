//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <type_traits>
#include <utility>

namespace mosaic {

//! Runs a callable when the enclosing scope exits, unless dismissed.
template <class F> class FinalAction {
public:
  explicit FinalAction(const F& ff) noexcept
    : f_ { ff }
  {
  }

  explicit FinalAction(F&& ff) noexcept
    : f_ { std::move(ff) }
  {
  }

  ~FinalAction() noexcept
  {
    if (invoke_) {
      f_();
    }
  }

  FinalAction(FinalAction&& other) noexcept
    : f_(std::move(other.f_))
    , invoke_(std::exchange(other.invoke_, false))
  {
  }

  FinalAction(const FinalAction&) = delete;
  void operator=(const FinalAction&) = delete;
  void operator=(FinalAction&&) = delete;

  //! Cancel the pending action, typically once a multi-step operation has
  //! fully succeeded and its rollback is no longer wanted.
  auto Dismiss() noexcept -> void { invoke_ = false; }

private:
  F f_;
  bool invoke_ = true;
};

//! Build a FinalAction executed at the end of the current scope.
/*!
 \code{cpp}
   auto cleanup = Finally([&] { std::filesystem::remove(temp, ec); });
   // ... write temp, rename it ...
   cleanup.Dismiss();
 \endcode
*/
template <class F> [[nodiscard]] auto Finally(F&& f) noexcept
{
  return FinalAction<std::decay_t<F>> { std::forward<F>(f) };
}

} // namespace mosaic
