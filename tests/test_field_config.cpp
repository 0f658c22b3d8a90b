#include <filesystem>
#include <fstream>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "crop_survey/errors.hpp"
#include "crop_survey/field_config.hpp"
#include "crop_survey/geometry.hpp"

using namespace crop_survey;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    crop_survey::test::ensure_logger_initialized();
    return true;
}();

nlohmann::json garden_document() {
    return nlohmann::json::parse(R"({
        "field_id": "test_001",
        "name": "Backyard Garden",
        "boundary": [[0, 0], [20, 0], [20, 15], [0, 15], [0, 0]],
        "obstacles": [
            {"type": "tree", "boundary": [[5, 5], [7, 5], [7, 7], [5, 7], [5, 5]]}
        ],
        "no_fly_zones": [
            [[15, 10], [18, 10], [18, 13], [15, 13]],
            {"boundary": [[1, 1], [2, 1], [2, 2], [1, 2]]}
        ],
        "reference_point": {"lat": 32.7, "lon": -117.1}
    })");
}

std::string config_error_field(const nlohmann::json& document) {
    try {
        (void)field_config_from_json(document);
    } catch (const ConfigError& exc) {
        return exc.field_name();
    }
    return {};
}
}  // namespace

TEST_CASE("Field config parses obstacles, no-fly zones and georeference") {
    const FieldConfig config = field_config_from_json(garden_document());

    REQUIRE(config.field_id == "test_001");
    REQUIRE(config.name == "Backyard Garden");
    REQUIRE(config.boundary.size() == 4);
    REQUIRE(config.obstacles.size() == 1);
    REQUIRE(config.obstacles[0].kind == "tree");
    REQUIRE(config.no_fly_zones.size() == 2);
    REQUIRE(config.reference_point.has_value());
    REQUIRE(config.reference_point->latitude_deg == Approx(32.7));

    const std::vector<Polygon> list_exclusions = exclusion_polygons(config);
    REQUIRE(list_exclusions.size() == 3);
    REQUIRE(geometry::signed_area(list_exclusions[0]) == Approx(4.0));
}

TEST_CASE("Field config normalizes clockwise boundaries") {
    nlohmann::json document = garden_document();
    document["boundary"] = nlohmann::json::parse("[[0, 0], [0, 15], [20, 15], [20, 0]]");

    const FieldConfig config = field_config_from_json(document);

    REQUIRE(geometry::signed_area(config.boundary) == Approx(300.0));
}

TEST_CASE("Field config errors name the offending key") {
    SECTION("missing boundary") {
        nlohmann::json document = garden_document();
        document.erase("boundary");
        REQUIRE(config_error_field(document) == "boundary");
    }

    SECTION("boundary with too few vertices") {
        nlohmann::json document = garden_document();
        document["boundary"] = nlohmann::json::parse("[[0, 0], [1, 1]]");
        REQUIRE(config_error_field(document) == "boundary");
    }

    SECTION("self-intersecting obstacle") {
        nlohmann::json document = garden_document();
        document["obstacles"][0]["boundary"] = nlohmann::json::parse("[[0, 0], [2, 2], [2, 0], [0, 2]]");
        REQUIRE(config_error_field(document) == "obstacles[0].boundary");
    }

    SECTION("zero-area no-fly zone") {
        nlohmann::json document = garden_document();
        document["no_fly_zones"][1]["boundary"] = nlohmann::json::parse("[[0, 0], [1, 1], [2, 2]]");
        REQUIRE(config_error_field(document) == "no_fly_zones[1]");
    }

    SECTION("non-numeric reference latitude") {
        nlohmann::json document = garden_document();
        document["reference_point"]["lat"] = "north";
        REQUIRE(config_error_field(document) == "reference_point.lat");
    }

    SECTION("reference point that is not an object") {
        nlohmann::json document = garden_document();
        document["reference_point"] = nlohmann::json::parse("[32.7, -117.1]");
        REQUIRE(config_error_field(document) == "reference_point");
    }

    SECTION("non-numeric vertex") {
        nlohmann::json document = garden_document();
        document["boundary"][1] = nlohmann::json::parse(R"(["a", 0])");
        REQUIRE(config_error_field(document) == "boundary");
    }
}

TEST_CASE("load_field_config reads a JSON file from disk") {
    const auto path_config = std::filesystem::temp_directory_path() / "crop_survey_field_config_test.json";
    {
        std::ofstream stream{path_config};
        stream << garden_document().dump();
    }

    const FieldConfig config = load_field_config(path_config);
    REQUIRE(config.name == "Backyard Garden");

    std::filesystem::remove(path_config);
    REQUIRE_THROWS_AS(load_field_config(path_config), ConfigError);
}

TEST_CASE("load_field_config reports a malformed reference point as ConfigError") {
    const auto path_config = std::filesystem::temp_directory_path() / "crop_survey_bad_reference_test.json";
    {
        nlohmann::json document = garden_document();
        document["reference_point"]["lon"] = nlohmann::json::object();
        std::ofstream stream{path_config};
        stream << document.dump();
    }

    REQUIRE_THROWS_AS(load_field_config(path_config), ConfigError);
    std::filesystem::remove(path_config);
}
