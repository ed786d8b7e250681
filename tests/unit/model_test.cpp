#include <catch2/catch_all.hpp>
#include <lumen/model.hpp>

using namespace lumen;

TEST_CASE("model table is consistent", "[model]") {
  const auto& models = all_models();
  REQUIRE(models.size() == 4);
  for (const auto& m : models) {
    auto info = model_info(m.id);
    REQUIRE(info.has_value());
    REQUIRE(info->dim == m.dim);
    REQUIRE(model_dim(m.id) == m.dim);
    auto back = model_from_code(static_cast<std::uint16_t>(m.id));
    REQUIRE(back.has_value());
    REQUIRE(*back == m.id);
  }
  REQUIRE(model_dim(kDefaultModel) == 512);
  REQUIRE(model_dim(ModelId::clip_vit_l14) == 768);
}

TEST_CASE("parse_model accepts canonical names and slugs", "[model]") {
  auto a = parse_model("openai/clip-vit-base-patch32");
  REQUIRE(a.has_value());
  REQUIRE(*a == ModelId::clip_vit_b32);
  auto b = parse_model("clip-vit-l14-336");
  REQUIRE(b.has_value());
  REQUIRE(*b == ModelId::clip_vit_l14_336);
}

TEST_CASE("unknown models are unsupported", "[model]") {
  auto p = parse_model("resnet50");
  REQUIRE_FALSE(p.has_value());
  REQUIRE(p.error().code == core::error_code::unsupported);

  auto c = model_from_code(99);
  REQUIRE_FALSE(c.has_value());
  REQUIRE(c.error().code == core::error_code::unsupported);

  const auto bogus = static_cast<ModelId>(77);
  REQUIRE(model_dim(bogus) == 0);
  REQUIRE_FALSE(model_info(bogus).has_value());
}
