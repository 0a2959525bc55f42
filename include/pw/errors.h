#pragma once

#include <string_view>

namespace pw::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kUnsupportedTaskPlugin{"Task plugin is not supported"};
inline constexpr std::string_view kUnsupportedCommand{"Command is not supported by any plugin"};
inline constexpr std::string_view kEmptyTypeReference{"Plugin type reference must not be empty"};
inline constexpr std::string_view kEmptyTaskId{"Task plugin id must not be empty"};
inline constexpr std::string_view kEmptyStage{"Task plugin stage must not be empty"};
inline constexpr std::string_view kEmptyArea{"Command plugin area must not be empty"};
inline constexpr std::string_view kEmptyEvent{"Command plugin event must not be empty"};
inline constexpr std::string_view kEmptyDisplayName{"Command plugin display name must not be empty"};
inline constexpr std::string_view kRegistrySealed{"Plugin registry is sealed"};
inline constexpr std::string_view kTypeNotFound{"Plugin type not found"};
inline constexpr std::string_view kFactoryReturnedNothing{"Plugin factory returned no instance"};
inline constexpr std::string_view kFactoryThrew{"Plugin factory failed"};
inline constexpr std::string_view kNotATaskPlugin{"Type does not implement a task plugin"};
inline constexpr std::string_view kNotACommandPlugin{"Type does not implement a command plugin"};
inline constexpr std::string_view kModuleNotFound{"Plugin module not found in search directory"};
inline constexpr std::string_view kMalformedTypeReference{"Malformed plugin type reference"};
inline constexpr std::string_view kHelperMissing{"Plugin host executable not found"};
inline constexpr std::string_view kHelperIntegrityMismatch{"Plugin host executable failed integrity check"};
inline constexpr std::string_view kWorkDirectoryMissing{"Work directory does not exist"};
inline constexpr std::string_view kExitCodeNonZero{"Process exited with a non-zero exit code"};
inline constexpr std::string_view kInvocationCancelled{"Plugin invocation cancelled"};
inline constexpr std::string_view kLedgerAlreadyDrained{"Async command ledger has already been drained"};
inline constexpr std::string_view kJobAlreadyCompleted{"Job has already been completed"};
}  // namespace pw::errors::msg
