// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <steady/core/hasher.hpp>
#include <steady/core/outcome.hpp>
#include <optional>
#include <string_view>

namespace steady::core {

// Compare the computed digest with the declared one. Without a declared
// digest the transfer is accepted. On mismatch the file at `path` is
// deleted and integrity_failure is returned.
[[nodiscard]] DownloadOutcome verify_integrity(const Digest& computed,
                                               const std::optional<Digest>& declared,
                                               std::string_view path) noexcept;

} // namespace steady::core
