#pragma once

#include <filesystem>
#include <string>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

// Lower-case hex SHA-256 of the file contents.
[[nodiscard]] Result<std::string> sha256File(const std::filesystem::path& file);

// Writes "<hex>  <basename>\n", the format sha256sum -c understands.
[[nodiscard]] Result<void> writeHashRecord(const std::filesystem::path& record, const std::filesystem::path& file);

// Recomputes the digest of file and compares it with the record.
[[nodiscard]] Result<bool> verifyHashRecord(const std::filesystem::path& record, const std::filesystem::path& file);

} // namespace ReproVM
