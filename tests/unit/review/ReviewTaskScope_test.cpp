#include "gtest/gtest.h"
#include "core/error/Exceptions.h"
#include "core/review/core/ReviewTaskScope.h"

namespace planrunner::core::review {

namespace {

plan::Plan threeTaskPlan() {
    plan::Plan plan;
    plan.id = 4;
    for (const char* title : {"Parse config", "Write tests", "Update docs"}) {
        plan::Task task;
        task.title = title;
        plan.tasks.push_back(task);
    }
    return plan;
}

} // namespace

TEST(ReviewTaskScopeTest, EmptyFilterSelectsEveryTask) {
    EXPECT_EQ(ReviewTaskScope::select(threeTaskPlan(), {}), (std::vector<size_t>{0, 1, 2}));
}

TEST(ReviewTaskScopeTest, UnionOfIndicesAndTitlesIsSorted) {
    ReviewTaskFilter filter;
    filter.indices = {2, 2};
    filter.titles = {"parse CONFIG"};

    EXPECT_EQ(ReviewTaskScope::select(threeTaskPlan(), filter), (std::vector<size_t>{0, 2}));
}

TEST(ReviewTaskScopeTest, UnmatchedEntriesAreListedTogether) {
    ReviewTaskFilter filter;
    filter.indices = {1, 5, -1};
    filter.titles = {"Foo", "Write tests"};

    try {
        ReviewTaskScope::select(threeTaskPlan(), filter);
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(std::string(e.what()),
                  "Validation: plan 4: Unknown task indexes: 5, -1; Unknown task titles: \"Foo\"");
    }
}

TEST(ReviewTaskScopeTest, OnlyUnknownTitles) {
    ReviewTaskFilter filter;
    filter.titles = {"Missing"};
    try {
        ReviewTaskScope::select(threeTaskPlan(), filter);
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(std::string(e.what()), "Validation: plan 4: Unknown task titles: \"Missing\"");
    }
}

} // namespace planrunner::core::review
