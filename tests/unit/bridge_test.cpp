#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include <yaml-cpp/yaml.h>

#include "choice/choice.hpp"

namespace shapes {

class Shape {
 public:
  CHOICE_ROOT(Shape);
  virtual ~Shape() = default;

  std::string color = "black";
};

class Circle final : public Shape {
 public:
  double radius = 0.0;
};

// Intermediate abstract class sharing Shape's registry.
class Polygon : public Shape {
 public:
  [[nodiscard]] virtual auto Sides() const -> int = 0;
};

class Square final : public Polygon {
 public:
  [[nodiscard]] auto Sides() const -> int override {
    return 4;
  }

  double side = 0.0;
};

class Triangle final : public Polygon {
 public:
  [[nodiscard]] auto Sides() const -> int override {
    return 3;
  }

  double base = 0.0;
  double height = 0.0;
};

// Never registered.
class Hexagon final : public Polygon {
 public:
  [[nodiscard]] auto Sides() const -> int override {
    return 6;
  }
};

// Encodes a tag of its own that disagrees with its registration.
class Liar final : public Shape {};

// Encodes its own (correct) tag.
class Honest final : public Shape {};

// Starts a registry of its own below Shape.
class Sprite : public Shape {
 public:
  CHOICE_ROOT(Sprite);
};

class PixelSprite final : public Sprite {
 public:
  int scale = 1;
};

// Not a choice type: owns one.
struct Drawing {
  std::string title;
  std::shared_ptr<Shape> shape;
};

// Root with a default tag.
class Pet {
 public:
  CHOICE_ROOT(Pet);
  virtual ~Pet() = default;
};

class Cat final : public Pet {
 public:
  bool indoor = true;
};

class Dog final : public Pet {};

}  // namespace shapes

namespace YAML {

template <>
struct convert<shapes::Circle> {
  static auto encode(const shapes::Circle& rhs) -> Node {
    Node node;
    node["color"] = rhs.color;
    node["radius"] = rhs.radius;
    return node;
  }
  static auto decode(const Node& node, shapes::Circle& rhs) -> bool {
    if (!node.IsMap()) {
      return false;
    }
    choice::ValidateKeys(node, {"color", "radius"}, "Circle");
    if (node["color"]) {
      rhs.color = node["color"].as<std::string>();
    }
    rhs.radius = node["radius"].as<double>();
    return true;
  }
};

template <>
struct convert<shapes::Square> {
  static auto encode(const shapes::Square& rhs) -> Node {
    Node node;
    node["side"] = rhs.side;
    return node;
  }
  static auto decode(const Node& node, shapes::Square& rhs) -> bool {
    if (!node.IsMap()) {
      return false;
    }
    rhs.side = node["side"].as<double>();
    return true;
  }
};

template <>
struct convert<shapes::Triangle> {
  static auto encode(const shapes::Triangle& rhs) -> Node {
    Node node;
    node["base"] = rhs.base;
    node["height"] = rhs.height;
    return node;
  }
  static auto decode(const Node& node, shapes::Triangle& rhs) -> bool {
    if (!node.IsMap()) {
      return false;
    }
    rhs.base = node["base"].as<double>();
    rhs.height = node["height"].as<double>();
    return true;
  }
};

template <>
struct convert<shapes::Liar> {
  static auto encode(const shapes::Liar& /*rhs*/) -> Node {
    Node node;
    node["type"] = "circle";
    return node;
  }
  static auto decode(const Node& node, shapes::Liar& /*rhs*/) -> bool {
    return node.IsMap();
  }
};

template <>
struct convert<shapes::Honest> {
  static auto encode(const shapes::Honest& /*rhs*/) -> Node {
    Node node;
    node["type"] = "honest";
    return node;
  }
  static auto decode(const Node& node, shapes::Honest& /*rhs*/) -> bool {
    return node.IsMap();
  }
};

template <>
struct convert<shapes::PixelSprite> {
  static auto encode(const shapes::PixelSprite& rhs) -> Node {
    Node node;
    node["scale"] = rhs.scale;
    return node;
  }
  static auto decode(const Node& node, shapes::PixelSprite& rhs) -> bool {
    if (!node.IsMap()) {
      return false;
    }
    if (node["scale"]) {
      rhs.scale = node["scale"].as<int>();
    }
    return true;
  }
};

template <>
struct convert<shapes::Drawing> {
  static auto encode(const shapes::Drawing& rhs) -> Node {
    Node node;
    node["title"] = rhs.title;
    node["shape"] = rhs.shape;
    return node;
  }
  static auto decode(const Node& node, shapes::Drawing& rhs) -> bool {
    if (!node.IsMap()) {
      return false;
    }
    rhs.title = node["title"].as<std::string>();
    rhs.shape = node["shape"].as<std::shared_ptr<shapes::Shape>>();
    return true;
  }
};

template <>
struct convert<shapes::Cat> {
  static auto encode(const shapes::Cat& rhs) -> Node {
    Node node;
    node["indoor"] = rhs.indoor;
    return node;
  }
  static auto decode(const Node& node, shapes::Cat& rhs) -> bool {
    if (!node.IsMap()) {
      return false;
    }
    if (node["indoor"]) {
      rhs.indoor = node["indoor"].as<bool>();
    }
    return true;
  }
};

template <>
struct convert<shapes::Dog> {
  static auto encode(const shapes::Dog& /*rhs*/) -> Node {
    return Node(NodeType::Map);
  }
  static auto decode(const Node& node, shapes::Dog& /*rhs*/) -> bool {
    return node.IsMap();
  }
};

}  // namespace YAML

namespace shapes {

CHOICE_DEFINE_ROOT(Shape);
CHOICE_DEFINE_ROOT(Sprite);
CHOICE_DEFINE_ROOT(Pet, .default_tag = "cat");

CHOICE_REGISTER_VARIANT(Shape, "circle", Circle);
CHOICE_REGISTER_VARIANT(Polygon, "square", Square);
CHOICE_REGISTER_VARIANT(Polygon, "triangle", Triangle);
CHOICE_REGISTER_VARIANT(Shape, "liar", Liar);
CHOICE_REGISTER_VARIANT(Shape, "honest", Honest);
CHOICE_REGISTER_VARIANT(Shape, "sprite", PixelSprite);
CHOICE_REGISTER_VARIANT(Sprite, "pixel", PixelSprite);
CHOICE_REGISTER_VARIANT(Pet, "cat", Cat);
CHOICE_REGISTER_VARIANT(Pet, "dog", Dog);

namespace {

class BridgeTest : public ::testing::Test {
 protected:
  static auto DecodeShape(const std::string& yaml) -> std::shared_ptr<Shape> {
    return choice::Decode<Shape>(YAML::Load(yaml));
  }

  // Message of the ParsingError raised by decoding `yaml` as T.
  template <typename T>
  static auto ParsingMessage(const std::string& yaml) -> std::string {
    try {
      (void)choice::Decode<T>(YAML::Load(yaml));
    } catch (const choice::ParsingError& e) {
      EXPECT_EQ(e.GetDiagnostic().kind, choice::DiagKind::kParsing);
      return e.GetDiagnostic().message;
    }
    ADD_FAILURE() << "expected ParsingError for: " << yaml;
    return "";
  }
};

// =============================================================================
// Decode against the root
// =============================================================================

TEST_F(BridgeTest, DecodesTaggedVariant) {
  auto shape = DecodeShape("{type: circle, radius: 2.0}");

  auto circle = std::dynamic_pointer_cast<Circle>(shape);
  ASSERT_NE(circle, nullptr);
  EXPECT_DOUBLE_EQ(circle->radius, 2.0);
  EXPECT_EQ(circle->color, "black");
}

TEST_F(BridgeTest, DecodeDoesNotModifyInput) {
  YAML::Node input = YAML::Load("{type: square, side: 3.0}");

  (void)choice::Decode<Shape>(input);

  ASSERT_TRUE(input["type"]);
  EXPECT_EQ(input["type"].as<std::string>(), "square");
  EXPECT_EQ(input.size(), 2);
}

TEST_F(BridgeTest, MissingTagWithoutDefaultListsKnownTags) {
  auto message = ParsingMessage<Shape>("{radius: 2.0}");

  EXPECT_NE(message.find("expected a 'type' key"), std::string::npos)
      << message;
  EXPECT_NE(message.find(R"("circle")"), std::string::npos) << message;
  EXPECT_NE(message.find(R"("square")"), std::string::npos) << message;
}

TEST_F(BridgeTest, UnknownTagCarriesTagAndCandidates) {
  auto message = ParsingMessage<Shape>("{type: nope}");

  EXPECT_NE(message.find("'nope'"), std::string::npos) << message;
  EXPECT_NE(
      message.find(
          R"({"circle","honest","liar","sprite","square","triangle"})"),
      std::string::npos)
      << message;
}

TEST_F(BridgeTest, UnknownTagPointsAtTagValue) {
  try {
    (void)choice::Decode<Shape>(YAML::Load("side: 1\ntype: nope\n"));
    FAIL() << "expected ParsingError";
  } catch (const choice::ParsingError& e) {
    const auto& mark = e.GetDiagnostic().mark;
    ASSERT_TRUE(mark.has_value());
    EXPECT_EQ(mark->line, 1);
  }
}

TEST_F(BridgeTest, NonMappingInputIsRejected) {
  auto message = ParsingMessage<Shape>("[1, 2, 3]");

  EXPECT_NE(message.find("expected a mapping"), std::string::npos) << message;
}

TEST_F(BridgeTest, NonScalarTagIsRejected) {
  auto message = ParsingMessage<Shape>("{type: [circle]}");

  EXPECT_NE(message.find("'type' key must be a string"), std::string::npos)
      << message;
}

TEST_F(BridgeTest, StructuralFailureNamesVariant) {
  auto message = ParsingMessage<Shape>("{type: circle, radius: wide}");

  EXPECT_NE(message.find("'circle'"), std::string::npos) << message;
  EXPECT_NE(message.find("Circle"), std::string::npos) << message;
}

TEST_F(BridgeTest, UnknownFieldIsRejected) {
  auto message = ParsingMessage<Shape>("{type: circle, radius: 1, sides: 3}");

  EXPECT_NE(message.find("unknown field 'sides'"), std::string::npos)
      << message;
}

TEST_F(BridgeTest, TryDecodeReportsDiagnostic) {
  auto ok = choice::TryDecode<Shape>(YAML::Load("{type: circle, radius: 1}"));
  ASSERT_TRUE(ok.has_value());
  EXPECT_NE(std::dynamic_pointer_cast<Circle>(*ok), nullptr);

  auto bad = choice::TryDecode<Shape>(YAML::Load("{type: nope}"));
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind, choice::DiagKind::kParsing);
}

// =============================================================================
// Default tag
// =============================================================================

TEST_F(BridgeTest, MissingTagFallsBackToDefault) {
  auto pet = choice::Decode<Pet>(YAML::Load("{indoor: false}"));

  auto cat = std::dynamic_pointer_cast<Cat>(pet);
  ASSERT_NE(cat, nullptr);
  EXPECT_FALSE(cat->indoor);
}

TEST_F(BridgeTest, NullInputUsesDefault) {
  auto pet = choice::Decode<Pet>(YAML::Node());

  EXPECT_NE(std::dynamic_pointer_cast<Cat>(pet), nullptr);
}

TEST_F(BridgeTest, NullTagUsesDefault) {
  auto pet = choice::Decode<Pet>(YAML::Load("{type: ~, indoor: false}"));

  auto cat = std::dynamic_pointer_cast<Cat>(pet);
  ASSERT_NE(cat, nullptr);
  EXPECT_FALSE(cat->indoor);
}

TEST_F(BridgeTest, NullTagWithoutDefaultIsMissingTag) {
  auto message = ParsingMessage<Shape>("{type: null, radius: 2.0}");

  EXPECT_NE(message.find("expected a 'type' key"), std::string::npos)
      << message;
}

TEST_F(BridgeTest, ExplicitTagBeatsDefault) {
  auto pet = choice::Decode<Pet>(YAML::Load("{type: dog}"));

  EXPECT_NE(std::dynamic_pointer_cast<Dog>(pet), nullptr);
}

// =============================================================================
// Decode against a leaf
// =============================================================================

TEST_F(BridgeTest, LeafDecodesItsOwnFields) {
  auto circle = choice::Decode<Circle>(YAML::Load("{radius: 5}"));

  ASSERT_NE(circle, nullptr);
  EXPECT_DOUBLE_EQ(circle->radius, 5.0);
}

TEST_F(BridgeTest, LeafRejectsTag) {
  auto message = ParsingMessage<Circle>("{type: circle, radius: 1}");

  EXPECT_NE(message.find("unexpected choice key 'circle'"), std::string::npos)
      << message;
  EXPECT_NE(message.find("leaf type"), std::string::npos) << message;
}

TEST_F(BridgeTest, LeafIgnoresNullTag) {
  auto circle = choice::Decode<Circle>(YAML::Load("{type: ~, radius: 3}"));

  ASSERT_NE(circle, nullptr);
  EXPECT_DOUBLE_EQ(circle->radius, 3.0);
}

// =============================================================================
// Decode through an intermediate class
// =============================================================================

TEST_F(BridgeTest, IntermediateClassDecodesItsVariants) {
  auto polygon = choice::Decode<Polygon>(
      YAML::Load("{type: triangle, base: 2, height: 3}"));

  ASSERT_NE(polygon, nullptr);
  EXPECT_EQ(polygon->Sides(), 3);
}

TEST_F(BridgeTest, IntermediateClassRejectsOtherVariants) {
  auto message = ParsingMessage<Polygon>("{type: circle, radius: 1}");

  EXPECT_NE(message.find("not a shapes::Polygon"), std::string::npos)
      << message;
}

// =============================================================================
// Pass-through
// =============================================================================

TEST_F(BridgeTest, ConstructedInstancePassesThrough) {
  auto circle = std::make_shared<Circle>();
  circle->radius = 7.0;

  auto decoded = choice::Decode<Shape>(std::shared_ptr<Shape>(circle));

  EXPECT_EQ(decoded.get(), circle.get());
}

// =============================================================================
// Encode
// =============================================================================

TEST_F(BridgeTest, EncodePutsTagFirst) {
  Square square;
  square.side = 3.0;

  auto node = choice::Encode(static_cast<const Shape&>(square));

  ASSERT_TRUE(node.IsMap());
  ASSERT_EQ(node.size(), 2);
  auto it = node.begin();
  EXPECT_EQ(it->first.as<std::string>(), "type");
  EXPECT_EQ(it->second.as<std::string>(), "square");
  ++it;
  EXPECT_EQ(it->first.as<std::string>(), "side");
  EXPECT_DOUBLE_EQ(it->second.as<double>(), 3.0);
}

TEST_F(BridgeTest, EncodeUsesRuntimeType) {
  std::shared_ptr<Shape> shape =
      DecodeShape("{type: triangle, base: 1, height: 2}");

  auto node = choice::Encode(*shape);

  EXPECT_EQ(node["type"].as<std::string>(), "triangle");
  EXPECT_DOUBLE_EQ(node["height"].as<double>(), 2.0);
}

TEST_F(BridgeTest, RoundTripPreservesVariantAndFields) {
  auto original = DecodeShape("{type: circle, color: red, radius: 1.5}");

  auto again = choice::Decode<Shape>(choice::Encode(*original));

  auto circle = std::dynamic_pointer_cast<Circle>(again);
  ASSERT_NE(circle, nullptr);
  EXPECT_EQ(circle->color, "red");
  EXPECT_DOUBLE_EQ(circle->radius, 1.5);
}

TEST_F(BridgeTest, EncodeUnregisteredTypeThrows) {
  Hexagon hexagon;

  EXPECT_THROW(
      (void)choice::Encode(static_cast<const Shape&>(hexagon)),
      std::invalid_argument);
}

TEST_F(BridgeTest, EncodeMismatchedTagIsInternalError) {
  Liar liar;

  EXPECT_THROW(
      (void)choice::Encode(static_cast<const Shape&>(liar)),
      choice::InternalError);
}

TEST_F(BridgeTest, EncodeMatchingTagIsKeptOnce) {
  Honest honest;

  auto node = choice::Encode(static_cast<const Shape&>(honest));

  EXPECT_EQ(node.size(), 1);
  EXPECT_EQ(node["type"].as<std::string>(), "honest");
}

// =============================================================================
// Nested choice members
// =============================================================================

TEST_F(BridgeTest, NestedMemberDecodesThroughConvert) {
  auto drawing = YAML::Load("title: logo\nshape: {type: square, side: 2}\n")
                     .as<Drawing>();

  EXPECT_EQ(drawing.title, "logo");
  auto square = std::dynamic_pointer_cast<Square>(drawing.shape);
  ASSERT_NE(square, nullptr);
  EXPECT_DOUBLE_EQ(square->side, 2.0);
}

TEST_F(BridgeTest, NestedMemberEncodesWithTag) {
  Drawing drawing;
  drawing.title = "dot";
  auto circle = std::make_shared<Circle>();
  circle->radius = 0.5;
  drawing.shape = circle;

  YAML::Node node(drawing);

  EXPECT_EQ(node["shape"]["type"].as<std::string>(), "circle");
  EXPECT_DOUBLE_EQ(node["shape"]["radius"].as<double>(), 0.5);
}

TEST_F(BridgeTest, NestedMemberErrorsPropagate) {
  EXPECT_THROW(
      (void)YAML::Load("title: bad\nshape: {type: nope}\n").as<Drawing>(),
      choice::ParsingError);
}

// =============================================================================
// Descendant with its own root
// =============================================================================

TEST_F(BridgeTest, DescendantRootHasItsOwnTable) {
  EXPECT_EQ(Sprite::ChoiceRegistry().KnownTagSet(), R"({"pixel"})");
  EXPECT_NE(
      static_cast<choice::RegistryCore*>(&Sprite::ChoiceRegistry()),
      static_cast<choice::RegistryCore*>(&Shape::ChoiceRegistry()));
}

TEST_F(BridgeTest, DescendantRootDecodesItsOwnTags) {
  auto sprite = choice::Decode<Sprite>(YAML::Load("{type: pixel, scale: 4}"));
  auto pixel = std::dynamic_pointer_cast<PixelSprite>(sprite);
  ASSERT_NE(pixel, nullptr);
  EXPECT_EQ(pixel->scale, 4);

  auto shape = DecodeShape("{type: sprite}");
  EXPECT_NE(std::dynamic_pointer_cast<PixelSprite>(shape), nullptr);
}

TEST_F(BridgeTest, EncodeUsesStaticTypesRegistry) {
  PixelSprite pixel;

  auto as_shape = choice::Encode(static_cast<const Shape&>(pixel));
  auto as_sprite = choice::Encode(static_cast<const Sprite&>(pixel));

  EXPECT_EQ(as_shape["type"].as<std::string>(), "sprite");
  EXPECT_EQ(as_sprite["type"].as<std::string>(), "pixel");
}

// =============================================================================
// Normalize
// =============================================================================

TEST_F(BridgeTest, NormalizeFillsDefaults) {
  auto& registry = *choice::RootCatalog::Instance().Find("Pet");

  auto node = choice::bridge::Normalize(registry, YAML::Load("{}"));

  EXPECT_EQ(node["type"].as<std::string>(), "cat");
  EXPECT_TRUE(node["indoor"].as<bool>());
}

TEST_F(BridgeTest, NormalizeReportsBadInput) {
  auto& registry = *choice::RootCatalog::Instance().Find("Shape");

  EXPECT_THROW(
      (void)choice::bridge::Normalize(registry, YAML::Load("{type: nope}")),
      choice::ParsingError);
}

}  // namespace
}  // namespace shapes
