#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include "local_storage.hpp"

// SHA-256 helpers for verifying resumed transfers. Digests are lowercase hex.

std::string sha256_hex(const std::string& data);

// Hash a local file through the storage interface.
Result<std::string> sha256_local(LocalStorage& storage, const std::string& path);

// Extract the digest from `sha256sum <path>` output.
std::optional<std::string> parse_sha256_output(const std::string& output);
