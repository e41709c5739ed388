#include "sandbox/docker.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Not;

using sandbox::ContainerSpec;
using sandbox::DockerOptions;
using sandbox::DockerRuntime;
using sandbox::NetworkMode;

// Value following flag in args, or "" if absent.
std::string After(const std::vector<std::string>& args,
                  const std::string& flag) {
  for (size_t i = 0; i + 1 < args.size(); i++) {
    if (args[i] == flag) return args[i + 1];
  }
  return "";
}

ContainerSpec Spec() {
  ContainerSpec spec;
  spec.name = "rexec-sbx-1";
  spec.config.cpu_limit = 0.5;
  spec.config.memory_mb = 256;
  spec.config.disk_mb = 32;
  spec.config.max_procs = 16;
  spec.labels["rexec.sandbox"] = "sbx-1";
  return spec;
}

// NOLINTNEXTLINE
TEST(DockerTest, CreateArgsApplyLimits) {
  DockerRuntime docker(DockerOptions{});
  auto args = docker.CreateArgs(Spec());
  ASSERT_GE(args.size(), 2);
  EXPECT_EQ(args[0], "docker");
  EXPECT_EQ(args[1], "create");
  EXPECT_EQ(After(args, "--name"), "rexec-sbx-1");
  EXPECT_EQ(After(args, "--network"), "none");
  EXPECT_EQ(After(args, "--cpus"), "0.50");
  EXPECT_EQ(After(args, "--memory"), "256m");
  EXPECT_EQ(After(args, "--memory-swap"), "256m");
  EXPECT_EQ(After(args, "--pids-limit"), "16");
  EXPECT_EQ(After(args, "--tmpfs"), "/workspace:rw,exec,nosuid,size=32m");
  EXPECT_EQ(After(args, "--cap-drop"), "ALL");
  EXPECT_EQ(After(args, "--security-opt"), "no-new-privileges");
  EXPECT_EQ(After(args, "--label"), "rexec.sandbox=sbx-1");
  EXPECT_THAT(args, Contains("--read-only"));
  EXPECT_EQ(args[args.size() - 3], "rexec-box:latest");
  EXPECT_EQ(args.back(), "infinity");
}

// NOLINTNEXTLINE
TEST(DockerTest, BridgeNetworkWhenRequested) {
  DockerRuntime docker(DockerOptions{});
  ContainerSpec spec = Spec();
  spec.config.network = NetworkMode::BRIDGE;
  EXPECT_EQ(After(docker.CreateArgs(spec), "--network"), "bridge");
}

// NOLINTNEXTLINE
TEST(DockerTest, HostIsPassedFirst) {
  DockerOptions options;
  options.docker = "/usr/bin/docker";
  options.host = "unix:///run/docker.sock";
  DockerRuntime docker(options);
  EXPECT_THAT(docker.RemoveArgs("abc"),
              ElementsAre("/usr/bin/docker", "--host",
                          "unix:///run/docker.sock", "rm", "-f", "abc"));
  EXPECT_THAT(docker.StartArgs("abc"),
              ElementsAre("/usr/bin/docker", "--host",
                          "unix:///run/docker.sock", "start", "abc"));
}

// NOLINTNEXTLINE
TEST(DockerTest, ExecArgs) {
  DockerRuntime docker(DockerOptions{});
  EXPECT_THAT(docker.ExecArgs("abc", {"/usr/local/bin/rexec", "box"}),
              ElementsAre("docker", "exec", "-i", "abc",
                          "/usr/local/bin/rexec", "box"));
}

// NOLINTNEXTLINE
TEST(DockerTest, MissingClientIsUnreachable) {
  DockerOptions options;
  options.docker = "/nonexistent/docker";
  DockerRuntime docker(options);
  EXPECT_FALSE(docker.Ping());
  std::string container_id;
  std::string error_msg;
  EXPECT_FALSE(docker.Create(Spec(), &container_id, &error_msg));
  EXPECT_NE(error_msg, "");
}

}  // namespace
