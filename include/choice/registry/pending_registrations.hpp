#pragma once

#include <cstddef>
#include <functional>

namespace choice {

// Queue behind CHOICE_REGISTER_VARIANT.
//
// Static registrars run inside static initialization or dlopen(), where an
// exception cannot reach any caller. They only queue the registration; the
// queue is applied by SharedLibraryLoader right after dlopen() and by every
// registry lookup, so a ConflictError surfaces on the importer's stack.

// Appends a registration. Returns true so it can initialize a namespace-scope
// constant.
auto QueueRegistration(std::function<void()> apply) -> bool;

// Applies queued registrations in queue order. Stops at the first one that
// throws and rethrows it; the entries after it stay queued for the next call.
void ApplyPendingRegistrations();

[[nodiscard]] auto PendingRegistrationCount() -> std::size_t;

}  // namespace choice
