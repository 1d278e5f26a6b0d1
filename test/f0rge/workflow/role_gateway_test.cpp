#include <doctest/doctest.h>

#include "f0rge/workflow/role_gateway.hpp"

namespace {

using f0rge::error_code;
using f0rge::workflow::command_gateway_config;
using f0rge::workflow::command_role_gateway;
using f0rge::workflow::parse_role;
using f0rge::workflow::role;

} // namespace

TEST_CASE("role names round trip") {
  CHECK(parse_role("Plan_Emission") == role::plan_emission);
  CHECK(parse_role(" critique ") == role::critique);
  CHECK_FALSE(parse_role("architect").has_value());
}

TEST_CASE("command gateway writes role, context and task to stdin") {
  command_gateway_config config;
  config.default_command = {"/bin/sh", "-c", "cat"};
  command_role_gateway gateway(config);

  auto answer = gateway.call(role::critique, "review it", "{\"proposal\": \"x\"}");
  REQUIRE(answer.ok());
  CHECK(answer.value == command_role_gateway::compose_input(role::critique, "review it", "{\"proposal\": \"x\"}"));
  CHECK(answer.value.find("ROLE: critique") == 0);
  CHECK(answer.value.find("TASK:\nreview it") != std::string::npos);
}

TEST_CASE("command gateway uses per-role commands") {
  command_gateway_config config;
  config.default_command = {"/bin/sh", "-c", "echo default"};
  config.commands[role::arbitration] = {"/bin/sh", "-c", "echo 1"};
  command_role_gateway gateway(config);

  CHECK(gateway.call(role::arbitration, "pick", "").value == "1\n");
  CHECK(gateway.call(role::proposal, "idea", "").value == "default\n");
}

TEST_CASE("command gateway maps failures to status codes") {
  SUBCASE("nonzero exit") {
    command_gateway_config config;
    config.default_command = {"/bin/sh", "-c", "echo quota >&2; exit 2"};
    auto answer = command_role_gateway(config).call(role::proposal, "p", "");
    CHECK(answer.status.code == error_code::io_error);
    CHECK(answer.status.message.find("quota") != std::string::npos);
  }
  SUBCASE("no command") {
    command_role_gateway gateway(command_gateway_config{});
    CHECK(gateway.call(role::proposal, "p", "").status.code == error_code::config_error);
  }
  SUBCASE("timeout") {
    command_gateway_config config;
    config.default_command = {"/bin/sh", "-c", "sleep 5"};
    config.timeout = std::chrono::milliseconds(150);
    auto answer = command_role_gateway(config).call(role::proposal, "p", "");
    CHECK(answer.status.code == error_code::timeout);
  }
}
