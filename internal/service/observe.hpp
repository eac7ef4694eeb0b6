#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"

namespace cloudsim::service {

/*
  Runs one service operation, logging its outcome.

  Exceptions are logged with the operation name and rethrown unchanged;
  callers translate them with ToApiError().
*/
template <typename Fn>
auto ObserveOperation(std::string_view operation, Fn&& fn) {
  using cloudsim::observability::IntField;
  using cloudsim::observability::StringField;

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_us = [&] {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      CLOUDSIM_LOG_DEBUG("operation ok", {StringField("operation", operation), IntField("elapsed_us", elapsed_us())});
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      CLOUDSIM_LOG_DEBUG("operation ok", {StringField("operation", operation), IntField("elapsed_us", elapsed_us())});
      return result;
    }
  } catch (const std::exception& ex) {
    CLOUDSIM_LOG_INFO("operation failed",
                      {StringField("operation", operation), StringField("error", ex.what()), IntField("elapsed_us", elapsed_us())});
    throw;
  }
}

} // namespace cloudsim::service
