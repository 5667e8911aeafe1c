#include <gtest/gtest.h>
#include "docker_client.h"
#include "errors.h"
#include <json/json.h>
#include <memory>

namespace contestrun {
namespace {

Json::Value parse(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    EXPECT_TRUE(reader->parse(body.data(), body.data() + body.size(), &root, nullptr)) << body;
    return root;
}

class DockerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        spec.name = "contestrun-s1-1";
        spec.image = "codecontest/python-runner:latest";
        spec.command = {"/bin/sh", "-c", "python3 main.py"};
        spec.env = {"TZ=UTC", "LANG=C.UTF-8"};
        spec.labels["contestrun.worker"] = "runner-1";
        spec.memory_bytes = 256ULL * 1024 * 1024;
        spec.nano_cpus = 1000000000;
        spec.pids_limit = 32;
        spec.tmpfs["/tmp"] = "rw,noexec,nosuid,size=64m";
        spec.security_opts = {"no-new-privileges:true", "seccomp={}"};
        spec.max_open_files = 256;
        spec.max_file_size_bytes = 16 * 1024 * 1024;
    }

    ContainerSpec spec;
};

TEST_F(DockerClientTest, CreateBodyCarriesCommandAndEnvironment) {
    Json::Value body = parse(DockerClient::create_body(spec));

    EXPECT_EQ(body["Image"].asString(), "codecontest/python-runner:latest");
    EXPECT_EQ(body["WorkingDir"].asString(), "/workspace");
    ASSERT_EQ(body["Cmd"].size(), 3u);
    EXPECT_EQ(body["Cmd"][2].asString(), "python3 main.py");
    EXPECT_EQ(body["Env"][0].asString(), "TZ=UTC");
    EXPECT_EQ(body["Labels"]["contestrun.worker"].asString(), "runner-1");
    EXPECT_FALSE(body["Tty"].asBool()) << "Logs must stay multiplexed";
}

TEST_F(DockerClientTest, CreateBodyDisablesSwapAndNetwork) {
    Json::Value host = parse(DockerClient::create_body(spec))["HostConfig"];

    EXPECT_EQ(host["Memory"].asUInt64(), spec.memory_bytes);
    EXPECT_EQ(host["MemorySwap"].asUInt64(), spec.memory_bytes);
    EXPECT_EQ(host["NanoCpus"].asInt64(), 1000000000);
    EXPECT_EQ(host["PidsLimit"].asInt64(), 32);
    EXPECT_EQ(host["NetworkMode"].asString(), "none");
    EXPECT_TRUE(host["ReadonlyRootfs"].asBool());
    EXPECT_FALSE(host["Privileged"].asBool());
    EXPECT_EQ(host["CapDrop"][0].asString(), "ALL");
}

TEST_F(DockerClientTest, CreateBodyMountsScratchAreas) {
    Json::Value host = parse(DockerClient::create_body(spec))["HostConfig"];

    EXPECT_EQ(host["Tmpfs"]["/tmp"].asString(), "rw,noexec,nosuid,size=64m");
    ASSERT_EQ(host["Mounts"].size(), 1u);
    EXPECT_EQ(host["Mounts"][0]["Type"].asString(), "volume");
    EXPECT_EQ(host["Mounts"][0]["Target"].asString(), "/workspace");
}

TEST_F(DockerClientTest, CreateBodyLimitsFilesAndLogs) {
    Json::Value host = parse(DockerClient::create_body(spec))["HostConfig"];

    ASSERT_EQ(host["Ulimits"].size(), 2u);
    EXPECT_EQ(host["Ulimits"][0]["Name"].asString(), "nofile");
    EXPECT_EQ(host["Ulimits"][0]["Hard"].asInt64(), 256);
    EXPECT_EQ(host["Ulimits"][1]["Name"].asString(), "fsize");
    EXPECT_EQ(host["SecurityOpt"][0].asString(), "no-new-privileges:true");
    EXPECT_EQ(host["LogConfig"]["Type"].asString(), "json-file");
    EXPECT_EQ(host["LogConfig"]["Config"]["max-size"].asString(), "1m");
}

TEST_F(DockerClientTest, NetworkEnabledUsesBridge) {
    spec.network_disabled = false;

    Json::Value body = parse(DockerClient::create_body(spec));

    EXPECT_FALSE(body["NetworkDisabled"].asBool());
    EXPECT_EQ(body["HostConfig"]["NetworkMode"].asString(), "bridge");
}

TEST_F(DockerClientTest, UnreachableDaemonIsRuntimeError) {
    DockerClient client("/nonexistent/contestrun-test.sock");

    EXPECT_FALSE(client.ping());
    try {
        client.create(spec);
        FAIL() << "create against a missing socket must throw";
    } catch (const ContainerRuntimeError& e) {
        EXPECT_EQ(e.status(), 0) << "Transport failures carry no HTTP status";
    }
}

} // namespace
} // namespace contestrun
