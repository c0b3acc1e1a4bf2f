#include "gtest/gtest.h"
#include "core/error/Exceptions.h"
#include "core/plan/util/PlanSerializer.h"

namespace planrunner::core::plan {

namespace {

const char* kMarkdownPlan = R"(---
id: 12
uuid: 0b7c8a3e-1111-4a4a-9999-aaaaaaaaaaaa
title: Add workspace locking
goal: Prevent two agents from sharing a workspace
status: in_progress
priority: high
dependencies: [3, 4, 3]
parent: 10
epic: false
tags: [Backend, " infra ", backend]
createdAt: 2026-01-02T03:04:05.678Z
updatedAt: 2026-01-03T00:00:00.000Z
tasks:
  - title: Lock file format
    description: JSON with pid and hostname
    files: [src/lock.cpp]
    done: true
  - title: Stale detection
    steps:
      - prompt: Check the pid
        done: true
      - prompt: Check the age
---

Locks live in the lock directory.

Second paragraph.
)";

} // namespace

TEST(PlanSerializerTest, ParsesFrontMatterAndBody) {
    Plan plan = PlanSerializer::parse(kMarkdownPlan, "/tasks/12-lock.plan.md");

    EXPECT_EQ(plan.id, 12);
    EXPECT_EQ(plan.title, "Add workspace locking");
    EXPECT_EQ(plan.status, PlanStatus::IN_PROGRESS);
    ASSERT_TRUE(plan.priority.has_value());
    EXPECT_EQ(*plan.priority, PlanPriority::HIGH);
    // Duplicate dependency ids collapse
    EXPECT_EQ(plan.dependencies, (std::vector<int>{3, 4}));
    EXPECT_EQ(plan.parent, std::optional<int>(10));
    EXPECT_EQ(plan.tags, (std::vector<std::string>{"backend", "infra"}));
    EXPECT_EQ(plan.details, "Locks live in the lock directory.\n\nSecond paragraph.");

    ASSERT_EQ(plan.tasks.size(), 2u);
    EXPECT_TRUE(plan.tasks[0].done);
    EXPECT_EQ(plan.tasks[0].files, (std::vector<std::string>{"src/lock.cpp"}));
    ASSERT_EQ(plan.tasks[1].steps.size(), 2u);
    EXPECT_TRUE(plan.tasks[1].steps[0].done);
    EXPECT_FALSE(plan.tasks[1].steps[1].done);
    EXPECT_FALSE(plan.tasks[1].isComplete());
}

TEST(PlanSerializerTest, SerializeThenParsePreservesPlan) {
    Plan original = PlanSerializer::parse(kMarkdownPlan, "/tasks/12-lock.plan.md");

    std::string text = PlanSerializer::serialize(original, "/tasks/12-lock.plan.md");
    EXPECT_EQ(text.rfind("---\nid: 12\n", 0), 0u);

    Plan reparsed = PlanSerializer::parse(text, "/tasks/12-lock.plan.md");
    EXPECT_EQ(reparsed.id, original.id);
    EXPECT_EQ(reparsed.uuid, original.uuid);
    EXPECT_EQ(reparsed.goal, original.goal);
    EXPECT_EQ(reparsed.dependencies, original.dependencies);
    EXPECT_EQ(reparsed.tags, original.tags);
    EXPECT_EQ(reparsed.details, original.details);
    EXPECT_EQ(reparsed.createdAt, original.createdAt);
    ASSERT_EQ(reparsed.tasks.size(), original.tasks.size());
    EXPECT_EQ(reparsed.tasks[1].steps[1].prompt, "Check the age");
}

TEST(PlanSerializerTest, YamlLayoutKeepsDetailsAsKey) {
    Plan plan;
    plan.id = 3;
    plan.title = "Yaml plan";
    plan.details = "line one\nline two";
    Task task;
    task.title = "Only task";
    plan.tasks.push_back(task);

    std::string text = PlanSerializer::serialize(plan, "/tasks/3.yml");
    EXPECT_EQ(text.find("---"), std::string::npos);

    Plan reparsed = PlanSerializer::parse(text, "/tasks/3.yml");
    EXPECT_EQ(reparsed.details, "line one\nline two");
    EXPECT_EQ(reparsed.status, PlanStatus::PENDING);
    ASSERT_EQ(reparsed.tasks.size(), 1u);
}

TEST(PlanSerializerTest, OptionalFieldsAreOmitted) {
    Plan plan;
    plan.id = 5;
    std::string text = PlanSerializer::serialize(plan, "/tasks/5.plan.md");

    EXPECT_EQ(text.find("priority"), std::string::npos);
    EXPECT_EQ(text.find("parent"), std::string::npos);
    EXPECT_EQ(text.find("dependencies"), std::string::npos);
    EXPECT_NE(text.find("status: pending"), std::string::npos);
}

TEST(PlanSerializerTest, ValidationErrorsNameFileAndField) {
    auto expectValidation = [](const std::string& text, const std::string& needle) {
        try {
            PlanSerializer::parse(text, "/tasks/bad.plan.md");
            FAIL() << "expected ValidationException for " << needle;
        } catch (const ValidationException& e) {
            std::string message = e.what();
            EXPECT_NE(message.find("/tasks/bad.plan.md"), std::string::npos) << message;
            EXPECT_NE(message.find(needle), std::string::npos) << message;
        }
    };

    expectValidation("---\ntitle: no id\n---\n", "'id'");
    expectValidation("---\nid: 1\nstatus: finished\n---\n", "finished");
    expectValidation("---\nid: 1\npriority: critical\n---\n", "critical");
    expectValidation("---\nid: -2\n---\n", "positive");
    expectValidation("---\nid: 1\ntasks:\n  - description: untitled\n---\n", "tasks[0]");
    expectValidation("no front matter", "front matter");
    expectValidation("---\nid: 1\n", "unterminated");
}

TEST(PlanSerializerTest, RecognizesPlanFileNames) {
    EXPECT_TRUE(PlanSerializer::isPlanFile("a/1-x.plan.md"));
    EXPECT_TRUE(PlanSerializer::isPlanFile("a/1.yml"));
    EXPECT_TRUE(PlanSerializer::isPlanFile("a/1.yaml"));
    EXPECT_FALSE(PlanSerializer::isPlanFile("a/README.md"));
    EXPECT_TRUE(PlanSerializer::isMarkdownLayout("1-x.plan.md"));
    EXPECT_FALSE(PlanSerializer::isMarkdownLayout("1.yml"));
}

} // namespace planrunner::core::plan
