#pragma once

// ------------------------------------------------------------- Library defines

#ifndef __cplusplus
// --------------------------------------------------------------------------- C
#include <assert.h>
#include <stdio.h>

#else
// ------------------------------------------------------------------------- C++

// Contrib
#include <tl/expected.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#include "base/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <numeric>

#include <array>
#include <iostream>
#include <span>
#include <string>
#include <string_view>

#include <map>
#include <unordered_map>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace msgrpc {
// -----------------------------------------------------------------------------

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

using fmt::format;

using std::function;
using thunk_type = std::function<void()>;

using std::array;
using std::string;
using std::string_view;
using std::unordered_map;
using std::vector;

using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;
using std::weak_ptr;

using std::begin;
using std::cbegin;
using std::cend;
using std::end;

using std::error_code;

// NOTE:
//        1s is 1 second
using namespace std::literals::chrono_literals;

} // namespace msgrpc

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define MSGRPC_LIKELY(x) __builtin_expect(!!(x), 1)
#define MSGRPC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define MSGRPC_LIKELY(x) (!!(x))
#define MSGRPC_UNLIKELY(x) (!!(x))
#endif

// ------------------------------------------------------------------- Contracts

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
  if (!MSGRPC_LIKELY(condition))                                                                   \
  FATAL("precondition failed: {}", #condition)
#endif

#ifdef Ensures
#undef Ensures
#endif
#ifdef NDEBUG
#define Ensures(condition)
#else
#define Ensures(condition)                                                                         \
  if (!MSGRPC_LIKELY(condition))                                                                   \
  FATAL("postcondition failed: {}", #condition)
#endif

#endif // #defined cplusplus
