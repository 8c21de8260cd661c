#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "queries.hpp"
#include "config.hpp"
#include "estimator.hpp"

using json = nlohmann::json;

class QueryProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        json locs = json::parse(R"({
            "Warehouse":  {"lat": 17.4435, "lng": 78.3772, "type": "warehouse", "area_type": "industrial"},
            "Gachibowli": {"lat": 17.4401, "lng": 78.3489, "type": "commercial", "area_type": "it_hub"},
            "Kukatpally": {"lat": 17.4849, "lng": 78.4138, "type": "residential", "area_type": "residential"},
            "Ameerpet":   {"lat": 17.4375, "lng": 78.4482, "type": "commercial", "area_type": "commercial"},
            "Charminar":  {"lat": 17.3616, "lng": 78.4747, "type": "landmark", "area_type": "old_city"}
        })");
        json traffic = json::parse(R"({
            "area_base_traffic": {"Ameerpet": 1.4},
            "traffic_patterns": {
                "weekday_evening_rush": {"hours": [18], "affected_areas": ["Ameerpet"], "multiplier": 2.0},
                "night_minimal": {"hours": [2], "multiplier": 0.6}
            },
            "weather_impact": {"clear": 1.0, "rain": 1.3}
        })");
        builder.loadFromJson(locs, traffic);
        config.seed = 42;
        config.ga.generations = 30;
        config.ga.population_size = 20;
    }

    GraphBuilder builder;
    Config config;
};

TEST_F(QueryProcessorTest, ListsLocations) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", 1}, {"type", "locations"}});
    EXPECT_EQ(r["id"], 1);
    ASSERT_EQ(r["locations"].size(), 5u);
    EXPECT_TRUE(r["locations"][0].contains("lng"));
    EXPECT_TRUE(r["locations"][0].contains("area_type"));
}

TEST_F(QueryProcessorTest, SingleDestination) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", "q1"}, {"type", "optimize_route"}, {"start", "Warehouse"},
                         {"end", "Charminar"}, {"algorithm", "dijkstra"},
                         {"hour", 12}, {"day", 1}, {"weather", "clear"}});
    ASSERT_FALSE(r.contains("error")) << r.dump();
    EXPECT_TRUE(r["possible"].get<bool>());
    EXPECT_EQ(r["route"], json::array({"Warehouse", "Charminar"}));
    EXPECT_EQ(r["route_coords"].size(), 2u);
    EXPECT_EQ(r["algorithm_used"], "dijkstra");

    double km = haversine_km(17.4435, 78.3772, 17.3616, 78.4747);
    EXPECT_NEAR(r["distance"].get<double>(), km, 0.01);
    EXPECT_NEAR(r["estimated_time_minutes"].get<double>(), km / 30.0 * 60.0 + 5.0, 0.1);
    EXPECT_EQ(r["traffic_conditions"]["hour"], 12);
}

TEST_F(QueryProcessorTest, AStarSelectedByName) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", 2}, {"type", "optimize_route"}, {"start", "Warehouse"},
                         {"end", "Ameerpet"}, {"algorithm", "a_star"}, {"hour", 18}, {"day", 2}});
    ASSERT_FALSE(r.contains("error")) << r.dump();
    EXPECT_EQ(r["algorithm_used"], "a_star");
    EXPECT_EQ(r["route"].front(), "Warehouse");
    EXPECT_EQ(r["route"].back(), "Ameerpet");
}

TEST_F(QueryProcessorTest, MultiStopGenetic) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", 3}, {"type", "optimize_route"}, {"start", "Warehouse"},
                         {"stops", json::array({"Ameerpet", "Kukatpally", "Charminar"})},
                         {"algorithm", "genetic"}, {"hour", 18}, {"day", 2}, {"weather", "rain"}});
    ASSERT_FALSE(r.contains("error")) << r.dump();
    ASSERT_EQ(r["route"].size(), 5u);
    EXPECT_EQ(r["route"].front(), "Warehouse");
    EXPECT_EQ(r["route"].back(), "Warehouse");
    EXPECT_EQ(r["algorithm"], "genetic");
    EXPECT_EQ(r["algorithm_used"], "genetic");
    EXPECT_TRUE(r["complete"].get<bool>());
    EXPECT_GT(r["distance"].get<double>(), 0.0);
}

TEST_F(QueryProcessorTest, UnknownAlgorithmFallsBack) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", 4}, {"type", "optimize_route"}, {"start", "Warehouse"},
                         {"stops", json::array({"Ameerpet", "Kukatpally"})},
                         {"algorithm", "brute_force"}, {"hour", 10}, {"day", 3}});
    ASSERT_FALSE(r.contains("error")) << r.dump();
    EXPECT_EQ(r["algorithm"], "brute_force");
    EXPECT_EQ(r["algorithm_used"], "nearest_neighbor");
}

TEST_F(QueryProcessorTest, DefaultsStartAndAlgorithm) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", 5}, {"type", "optimize_route"},
                         {"stops", json::array({"Gachibowli"})}, {"hour", 9}, {"day", 0}});
    ASSERT_FALSE(r.contains("error")) << r.dump();
    EXPECT_EQ(r["route"], json::array({"Warehouse", "Gachibowli", "Warehouse"}));
    EXPECT_EQ(r["algorithm"], "genetic");
    EXPECT_EQ(r["traffic_conditions"]["weather"], "clear");
}

TEST_F(QueryProcessorTest, BadRequestsReportErrors) {
    QueryProcessor qp(builder, config);

    json no_target = qp.process({{"id", 6}, {"type", "optimize_route"}, {"hour", 9}, {"day", 0}});
    EXPECT_EQ(no_target["error"], "Either end or stops must be provided");

    json null_end = qp.process({{"id", 16}, {"type", "optimize_route"}, {"end", nullptr},
                                {"hour", 9}, {"day", 0}});
    EXPECT_EQ(null_end["error"], "Either end or stops must be provided");

    json empty_end = qp.process({{"id", 17}, {"type", "optimize_route"}, {"end", ""},
                                 {"stops", json::array()}, {"hour", 9}, {"day", 0}});
    EXPECT_EQ(empty_end["error"], "Either end or stops must be provided");

    json unknown = qp.process({{"id", 7}, {"type", "optimize_route"}, {"start", "Nowhere"},
                               {"end", "Charminar"}, {"hour", 9}, {"day", 0}});
    EXPECT_EQ(unknown["error"], "unknown location: Nowhere");

    json bad_hour = qp.process({{"id", 8}, {"type", "optimize_route"}, {"end", "Charminar"},
                                {"hour", 24}, {"day", 0}});
    EXPECT_TRUE(bad_hour.contains("error"));

    json bad_type = qp.process({{"id", 9}, {"type", "teleport"}});
    EXPECT_EQ(bad_type["error"], "unknown query type: teleport");

    json no_type = qp.process({{"id", 10}});
    EXPECT_TRUE(no_type.contains("error"));
    EXPECT_EQ(no_type["id"], 10);
}

TEST_F(QueryProcessorTest, PredictTraffic) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", 11}, {"type", "predict_traffic"}, {"location", "Ameerpet"},
                         {"hour", 18}, {"day", 2}, {"weather", "clear"}});
    ASSERT_FALSE(r.contains("error")) << r.dump();
    EXPECT_DOUBLE_EQ(r["traffic_multiplier"].get<double>(), 2.8);
    EXPECT_EQ(r["traffic_level"], "very_heavy");

    json night = qp.process({{"id", 12}, {"type", "predict_traffic"}, {"location", "Warehouse"},
                             {"hour", 2}, {"day", 2}});
    EXPECT_EQ(night["traffic_level"], "light");

    json missing = qp.process({{"id", 13}, {"type", "predict_traffic"}});
    EXPECT_EQ(missing["error"], "Location is required");
}

TEST_F(QueryProcessorTest, EstimateDelivery) {
    QueryProcessor qp(builder, config);
    json r = qp.process({{"id", 14}, {"type", "estimate_delivery"},
                         {"distance_km", 15}, {"num_stops", 3}});
    ASSERT_FALSE(r.contains("error")) << r.dump();
    EXPECT_DOUBLE_EQ(r["estimated_time_minutes"].get<double>(), 45.0);
    EXPECT_DOUBLE_EQ(r["estimated_time_hours"].get<double>(), 0.75);
    EXPECT_EQ(r["parameters"]["package_size"], "medium");

    json missing = qp.process({{"id", 15}, {"type", "estimate_delivery"}});
    EXPECT_EQ(missing["error"], "distance_km is required");
}

TEST(Estimator, FallbackFormula) {
    EXPECT_DOUBLE_EQ(estimate_delivery_minutes(30.0, 0), 60.0);
    EXPECT_DOUBLE_EQ(estimate_delivery_minutes(15.0, 3), 45.0);
    EXPECT_TRUE(std::isinf(estimate_delivery_minutes(std::numeric_limits<double>::infinity(), 2)));
    EXPECT_THROW(estimate_delivery_minutes(-1.0, 1), std::invalid_argument);
}

TEST(Estimator, TrafficLevels) {
    EXPECT_EQ(traffic_level(0.5), "light");
    EXPECT_EQ(traffic_level(0.8), "moderate");
    EXPECT_EQ(traffic_level(1.19), "moderate");
    EXPECT_EQ(traffic_level(1.2), "heavy");
    EXPECT_EQ(traffic_level(1.6), "very_heavy");
}

TEST(ConfigLoad, DefaultsAndOverrides) {
    Config d = load_config(json());
    EXPECT_EQ(d.ga.generations, 100);
    EXPECT_EQ(d.ga.population_size, 50);
    EXPECT_EQ(d.default_start, "Warehouse");
    EXPECT_FALSE(d.seed.has_value());

    Config c = load_config({{"generations", 10}, {"population_size", 8},
                            {"default_start", "Hub"}, {"seed", 7}});
    EXPECT_EQ(c.ga.generations, 10);
    EXPECT_EQ(c.ga.population_size, 8);
    EXPECT_EQ(c.default_start, "Hub");
    EXPECT_EQ(c.default_weather, "clear");
    ASSERT_TRUE(c.seed.has_value());
    EXPECT_EQ(*c.seed, 7u);
}

TEST(ConfigLoad, RejectsInvalidValues) {
    EXPECT_THROW(load_config({{"population_size", 0}}), std::invalid_argument);
    EXPECT_THROW(load_config({{"generations", -3}}), std::invalid_argument);
    EXPECT_THROW(load_config({{"mutation_rate", 1.5}}), std::invalid_argument);
    EXPECT_THROW(load_config(json::array()), std::invalid_argument);
}

TEST(ConfigLoad, RejectsNonIntegerAndOutOfRangeNumbers) {
    EXPECT_THROW(load_config(json::parse(R"({"generations": 2.9e10})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"generations": 5.7})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"generations": 30000000000})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"population_size": "50"})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"seed": -1})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"seed": 1.5})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"seed": 4294967296})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"mutation_rate": "high"})")), std::invalid_argument);
    EXPECT_THROW(load_config(json::parse(R"({"default_start": 3})")), std::invalid_argument);

    Config c = load_config(json::parse(R"({"seed": 4294967295, "generations": 0})"));
    EXPECT_EQ(*c.seed, 4294967295u);
    EXPECT_EQ(c.ga.generations, 0);
}
