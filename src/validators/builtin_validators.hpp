#pragma once
#include "../validator.hpp"
#include <string>
#include <optional>

namespace guardrail {

void register_naming_validator(ValidatorSet& set);
void register_debug_print_validator(ValidatorSet& set);
void register_banned_docs_validator(ValidatorSet& set);
void register_command_validator(ValidatorSet& set);

// All of the above.
void register_builtin_validators(ValidatorSet& set);

// Suffix-free name for a versioned copy ("Profile_improved.tsx" -> "Profile.tsx"),
// or nullopt when the name carries no versioning suffix.
std::optional<std::string> canonical_file_name(const std::string& file_name);

// Rewrites console.* calls to logger.*; sets *count to the number replaced.
std::string rewrite_debug_prints(const std::string& content, int* count);

} // namespace guardrail
