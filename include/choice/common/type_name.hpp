#pragma once

#include <string>
#include <typeindex>
#include <typeinfo>

namespace choice {

// Human-readable name of a type for diagnostics ("shapes::Circle" rather than
// the mangled "N6shapes6CircleE"). Falls back to the mangled name.
auto DemangledName(const std::type_info& type) -> std::string;
auto DemangledName(std::type_index type) -> std::string;

}  // namespace choice
