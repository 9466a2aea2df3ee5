#pragma once

#include <memory>

#include <yaml-cpp/yaml.h>

#include "choice/bridge/decode.hpp"
#include "choice/bridge/encode.hpp"

// Lets choice types nest inside ordinary YAML::convert codecs:
//
//   rhs.shape = node["shape"].as<std::shared_ptr<Shape>>();
//   node["shape"] = rhs.shape;
namespace YAML {

template <::choice::ChoiceType T>
struct convert<std::shared_ptr<T>> {
  static auto encode(const std::shared_ptr<T>& rhs) -> Node {
    if (rhs == nullptr) {
      return Node(NodeType::Null);
    }
    return ::choice::Encode(*rhs);
  }

  static auto decode(const Node& node, std::shared_ptr<T>& rhs) -> bool {
    rhs = ::choice::Decode<T>(node);
    return true;
  }
};

}  // namespace YAML
