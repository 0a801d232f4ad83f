// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <type_traits>
#include <utility>

namespace stackprof {

// Runs the callable when going out of scope, unless released
template <class EF> class scope_exit {
public:
  template <class Fn>
  explicit scope_exit(Fn &&fn) noexcept(
      std::is_nothrow_constructible_v<EF, Fn>)
      : _exit_function(std::forward<Fn>(fn)) {}

  scope_exit(scope_exit &&other) noexcept(
      std::is_nothrow_move_constructible_v<EF>)
      : _exit_function(std::move(other._exit_function)),
        _execute_on_destruction(other._execute_on_destruction) {
    other.release();
  }

  scope_exit(const scope_exit &) = delete;
  scope_exit &operator=(const scope_exit &) = delete;
  scope_exit &operator=(scope_exit &&) = delete;

  ~scope_exit() noexcept {
    if (_execute_on_destruction) {
      _exit_function();
    }
  }

  void release() noexcept { _execute_on_destruction = false; }

private:
  EF _exit_function;
  bool _execute_on_destruction{true};
};

template <class EF> scope_exit(EF) -> scope_exit<EF>;

namespace details {

struct DeferDummy {};

template <class F> scope_exit<std::decay_t<F>> operator*(DeferDummy, F &&f) {
  return scope_exit<std::decay_t<F>>{std::forward<F>(f)};
}

} // namespace details

template <class F> scope_exit<std::decay_t<F>> make_defer(F &&f) {
  return scope_exit<std::decay_t<F>>{std::forward<F>(f)};
}

} // namespace stackprof

#define DEFER_(LINE) zz_defer##LINE
#define DEFER(LINE) DEFER_(LINE)
#define defer                                                                  \
  [[maybe_unused]] const auto &DEFER(__COUNTER__) =                            \
      ::stackprof::details::DeferDummy{} *[&]()
