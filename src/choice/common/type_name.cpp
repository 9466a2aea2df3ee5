#include "choice/common/type_name.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>

#include <cxxabi.h>

namespace choice {

namespace {

auto Demangle(const char* mangled) -> std::string {
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
  if (status != 0 || demangled == nullptr) {
    return mangled;
  }
  return demangled.get();
}

}  // namespace

auto DemangledName(const std::type_info& type) -> std::string {
  return Demangle(type.name());
}

auto DemangledName(std::type_index type) -> std::string {
  return Demangle(type.name());
}

}  // namespace choice
