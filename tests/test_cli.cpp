#include <gtest/gtest.h>
#include "federated/model_protocol.h"
#include "test_utils.h"
#include "utils/json.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/wait.h>

using namespace fedcore;
using utils::JsonParser;
using utils::JsonValue;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        writeUpdates(UPDATES_PATH, TestUtils::diagonalUpdates(5, {{1000.0, 2000.0}}));
    }

    void TearDown() override {
        std::remove(UPDATES_PATH);
        std::remove(OUTPUT_PATH);
        std::remove(ERRORS_PATH);
    }

    static void writeUpdates(const char* path, const std::vector<ModelUpdate>& updates) {
        JsonValue list = JsonValue::array();
        for (const auto& update : updates) {
            list.push_back(update.toJson());
        }
        std::ofstream file(path);
        file << list.dump();
    }

    // Runs the tool with stdout and stderr captured to files; returns the exit code
    static int runTool(const std::string& args) {
        std::string command = std::string("\"") + FEDCORE_AGGREGATE_PATH + "\" " + args +
                              " > " + OUTPUT_PATH + " 2> " + ERRORS_PATH;
        int status = std::system(command.c_str());
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

    static std::string readFile(const char* path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    static constexpr const char* UPDATES_PATH = "./test_fedcore_cli_updates.json";
    static constexpr const char* OUTPUT_PATH = "./test_fedcore_cli_stdout.txt";
    static constexpr const char* ERRORS_PATH = "./test_fedcore_cli_stderr.txt";
};

TEST_F(CliTest, StdoutCarriesOnlyTheResultDocument) {
    ASSERT_EQ(runTool(std::string("--updates ") + UPDATES_PATH + " --method krum"), 0);

    JsonValue result = JsonParser::parse(readFile(OUTPUT_PATH));
    EXPECT_TRUE(result["success"].asBool());
    EXPECT_EQ(result["global_model"].getString("aggregation_method"), "krum_f1");
    EXPECT_EQ(result["suspected_byzantine"][0].asString(), "attacker_0");

    std::string errors = readFile(ERRORS_PATH);
    EXPECT_NE(errors.find("[Krum]"), std::string::npos);
    EXPECT_NE(errors.find("[FedCore]"), std::string::npos);
}

TEST_F(CliTest, FailedAggregationExitsWithTwo) {
    writeUpdates(UPDATES_PATH, TestUtils::diagonalUpdates(3));
    EXPECT_EQ(runTool(std::string("--updates ") + UPDATES_PATH + " --method krum"), 2);

    JsonValue result = JsonParser::parse(readFile(OUTPUT_PATH));
    EXPECT_FALSE(result["success"].asBool());
    EXPECT_TRUE(result["global_model"].isNull());
    EXPECT_EQ(result.getString("error_message"), "Krum requires at least 5 updates, got 3");
}

TEST_F(CliTest, UnknownMethodExitsWithOne) {
    EXPECT_EQ(runTool(std::string("--updates ") + UPDATES_PATH + " --method fedprox"), 1);
    EXPECT_TRUE(readFile(OUTPUT_PATH).empty());
    EXPECT_NE(readFile(ERRORS_PATH).find("Unknown aggregator: fedprox"), std::string::npos);
}

TEST_F(CliTest, MissingUpdatesArgumentExitsWithOne) {
    EXPECT_EQ(runTool("--method fedavg"), 1);
}
