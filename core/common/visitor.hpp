/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

#include <boost/variant.hpp>
#include <boost/variant/apply_visitor.hpp>

namespace auditsync {

  template <typename... Lambdas>
  struct lambda_visitor;

  template <typename Lambda, typename... Lambdas>
  struct lambda_visitor<Lambda, Lambdas...>
      : public Lambda, public lambda_visitor<Lambdas...> {
    using Lambda::operator();
    using lambda_visitor<Lambdas...>::operator();

    // NOLINTNEXTLINE(google-explicit-constructor)
    lambda_visitor(Lambda lambda, Lambdas... lambdas)
        : Lambda(lambda), lambda_visitor<Lambdas...>(lambdas...) {}
  };

  template <typename Lambda>
  struct lambda_visitor<Lambda> : public Lambda {
    using Lambda::operator();

    // NOLINTNEXTLINE(google-explicit-constructor)
    lambda_visitor(Lambda lambda) : Lambda(lambda) {}
  };

  template <class... Fs>
  constexpr auto make_visitor(Fs &&...fs) {
    using visitor_type = lambda_visitor<std::decay_t<Fs>...>;
    return visitor_type(std::forward<Fs>(fs)...);
  }

  /**
   * @brief Inplace visitor for boost::variant.
   * @code
   *   visit_in_place(message,
   *                  [](const SyncRequest &request) { ... },
   *                  [](const auto &) { ... });
   * @nocode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&...visitors) {
    return boost::apply_visitor(
        make_visitor(std::forward<TVisitors>(visitors)...),
        std::forward<TVariant>(variant));
  }

  /// Typed access to a variant alternative, nullopt when another one is held
  template <typename TReturn, typename TVariant>
  constexpr std::optional<std::reference_wrapper<const TReturn>> if_type(
      const TVariant &variant) {
    if (auto ptr = boost::get<TReturn>(&variant)) {
      return std::cref(*ptr);
    }
    return std::nullopt;
  }

  template <typename Type, typename TVariant>
  constexpr bool is_type(const TVariant &variant) {
    return boost::get<Type>(&variant) != nullptr;
  }

}  // namespace auditsync
