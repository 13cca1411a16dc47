#include <catch2/catch_test_macros.hpp>
#include "ctxsys/agent/agent_state.hpp"

using namespace ctxsys::agent;

TEST_CASE("Step status string conversion", "[agent_state]") {
    REQUIRE(step_status_to_string(StepStatus::Completed) == "completed");
    REQUIRE(step_status_from_string("skipped") == StepStatus::Skipped);
    REQUIRE(step_status_from_string("bogus") == StepStatus::Pending);

    REQUIRE(trigger_type_to_string(TriggerType::Error) == "error");
    REQUIRE(trigger_type_from_string("manual") == TriggerType::Manual);
}

TEST_CASE("PlanStep JSON", "[agent_state]") {
    PlanStep step;
    step.id = "s2";
    step.description = "Run the tests";
    step.action = "shell";
    step.parameters = {{"cmd", "ctest"}};
    step.status = StepStatus::Running;
    step.dependencies = {"s1"};

    auto j = step.to_json();
    REQUIRE(j["status"] == "running");
    REQUIRE(j["dependencies"] == Json::array({"s1"}));

    auto restored = PlanStep::from_json(j);
    REQUIRE(restored.id == "s2");
    REQUIRE(restored.action == "shell");
    REQUIRE(restored.parameters["cmd"] == "ctest");
    REQUIRE(restored.status == StepStatus::Running);
    REQUIRE(restored.dependencies == std::vector<StepId>{"s1"});
}

TEST_CASE("PlanStep from sparse JSON", "[agent_state]") {
    auto step = PlanStep::from_json(Json{{"id", "only-id"}});

    REQUIRE(step.id == "only-id");
    REQUIRE(step.status == StepStatus::Pending);
    REQUIRE(step.parameters.is_object());
    REQUIRE(step.dependencies.empty());
}

TEST_CASE("AgentState JSON keeps timestamps and last error", "[agent_state]") {
    AgentState state;
    state.query = "fix the build";
    state.current_step_index = 1;
    state.context = {{"repo", "ctxsys"}};

    PlanStep first;
    first.id = "a";
    first.action = "read";
    first.status = StepStatus::Completed;
    PlanStep second;
    second.id = "b";
    second.action = "write";
    second.status = StepStatus::Failed;
    state.plan = {first, second};

    auto completed_at = now();
    state.results.push_back(StepResult{
        .step_id = "a",
        .output = {{"lines", 12}},
        .completed_at = completed_at,
        .duration_ms = 34,
        .token_usage = 120
    });

    state.last_error = LastError{
        .step_index = 1,
        .message = "disk full",
        .timestamp = completed_at
    };

    auto restored = AgentState::from_json(Json::parse(state.to_json().dump()));

    REQUIRE(restored.query == "fix the build");
    REQUIRE(restored.current_step_index == 1);
    REQUIRE(restored.plan.size() == 2);
    REQUIRE(restored.plan[1].status == StepStatus::Failed);
    REQUIRE(restored.context["repo"] == "ctxsys");

    REQUIRE(restored.results.size() == 1);
    REQUIRE(restored.results[0].completed_at == completed_at);
    REQUIRE(restored.results[0].duration_ms == 34);
    REQUIRE(restored.results[0].token_usage == 120);
    REQUIRE(restored.results[0].output["lines"] == 12);

    REQUIRE(restored.last_error.has_value());
    REQUIRE(restored.last_error->message == "disk full");
    REQUIRE(restored.last_error->timestamp == completed_at);
    REQUIRE_FALSE(restored.is_complete());
}

TEST_CASE("AgentState completion", "[agent_state]") {
    AgentState state;
    REQUIRE(state.is_complete());

    state.plan.push_back(PlanStep{});
    REQUIRE_FALSE(state.is_complete());

    state.current_step_index = 1;
    REQUIRE(state.is_complete());
    REQUIRE_FALSE(state.to_json().contains("last_error"));
}
