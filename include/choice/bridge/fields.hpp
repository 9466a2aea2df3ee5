#pragma once

#include <initializer_list>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace choice {

// Rejects keys outside `allowed` with a ParsingError pointing at the
// offending key. For use inside a variant's YAML::convert<T>::decode when
// unknown fields must not be ignored. Non-mapping nodes are left alone.
void ValidateKeys(
    const YAML::Node& node, std::initializer_list<std::string_view> allowed,
    std::string_view context);

}  // namespace choice
