module;

#include <concepts>
#include <coroutine>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

export module tlscoro;

#define TLSCORO_MODULE_EXPORT 1
#include "../include/tlscoro/tlscoro.hpp"
