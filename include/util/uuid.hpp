#pragma once

#include <expected>
#include <string>

namespace billsync {

// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase hex form.
std::expected<std::string, std::string> GenerateUuidV4();

bool LooksLikeUuid(const std::string& s);

} // namespace billsync
