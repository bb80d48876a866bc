#pragma once

#include <string>

namespace execai::common {

/// Random (version 4) UUID in canonical lowercase form.
[[nodiscard]] std::string generate_uuid();

[[nodiscard]] bool is_uuid(const std::string &value);

} // namespace execai::common
