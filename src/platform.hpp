// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include <cstdint>

namespace docpress {

[[nodiscard]] std::int64_t get_pid() noexcept;
[[nodiscard]] std::int64_t get_tid() noexcept;

} // namespace docpress
