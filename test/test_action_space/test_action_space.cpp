#include "ActionSpace.h"
#include <Arduino.h>
#include <unity.h>

void setUp(void) {}

void tearDown(void) {}

// Test: 30..100 step 10 on both axes gives 8 x 8
void test_default_grid_size(void) {
    ActionSpace space({30, 100, 10}, {30, 100, 10});
    TEST_ASSERT_TRUE(space.isValid());
    TEST_ASSERT_EQUAL(64, space.size());
}

// Test: Axis sizes multiply
void test_asymmetric_grid_size(void) {
    ActionSpace space({40, 100, 20}, {20, 60, 10});
    // 40,60,80,100 x 20,30,40,50,60
    TEST_ASSERT_EQUAL(20, space.size());
}

// Test: A step that does not land on max stops below it
void test_step_not_reaching_max(void) {
    TEST_ASSERT_EQUAL(3, ActionSpace::axisSize({30, 100, 30})); // 30,60,90
}

// Test: Enumeration is radiator-major
void test_enumeration_order(void) {
    ActionSpace space({30, 50, 10}, {30, 50, 10});
    TEST_ASSERT_EQUAL(30, space.at(0).radiator_pct);
    TEST_ASSERT_EQUAL(30, space.at(0).storage_pct);
    TEST_ASSERT_EQUAL(30, space.at(1).radiator_pct);
    TEST_ASSERT_EQUAL(40, space.at(1).storage_pct);
    TEST_ASSERT_EQUAL(40, space.at(3).radiator_pct);
    TEST_ASSERT_EQUAL(30, space.at(3).storage_pct);

    for (size_t i = 1; i < space.size(); i++) {
        TEST_ASSERT_TRUE(space.at(i - 1) < space.at(i));
    }
}

// Test: Every action is a valid duty and unique
void test_actions_valid_and_unique(void) {
    ActionSpace space({30, 100, 10}, {30, 100, 10});
    for (size_t i = 0; i < space.size(); i++) {
        const Action &a = space.at(i);
        TEST_ASSERT_TRUE(a.radiator_pct >= 0 && a.radiator_pct <= 100);
        TEST_ASSERT_TRUE(a.storage_pct >= 0 && a.storage_pct <= 100);
        for (size_t j = i + 1; j < space.size(); j++) {
            TEST_ASSERT_TRUE(a != space.at(j));
        }
    }
}

// Test: contains() and maxAction()
void test_contains_and_max(void) {
    ActionSpace space({30, 100, 10}, {30, 100, 10});
    TEST_ASSERT_TRUE(space.contains({40, 70}));
    TEST_ASSERT_FALSE(space.contains({45, 70}));
    TEST_ASSERT_FALSE(space.contains({20, 70}));

    Action max = space.maxAction();
    TEST_ASSERT_EQUAL(100, max.radiator_pct);
    TEST_ASSERT_EQUAL(100, max.storage_pct);
    TEST_ASSERT_TRUE(space.contains(max));
}

// Test: Maximum stays on the grid when the step misses the configured max
void test_max_action_on_uneven_grid(void) {
    ActionSpace space({30, 100, 20}, {30, 100, 20});
    TEST_ASSERT_EQUAL(16, space.size());

    Action max = space.maxAction();
    TEST_ASSERT_EQUAL(90, max.radiator_pct);
    TEST_ASSERT_EQUAL(90, max.storage_pct);
    TEST_ASSERT_TRUE(space.contains(max));
}

// Test: Single-point grid
void test_single_action(void) {
    ActionSpace space({50, 50, 10}, {60, 60, 5});
    TEST_ASSERT_EQUAL(1, space.size());
    TEST_ASSERT_EQUAL(50, space.at(0).radiator_pct);
    TEST_ASSERT_EQUAL(60, space.at(0).storage_pct);
}

// Test: Invalid or oversized grids leave the space invalid
void test_invalid_grids(void) {
    ActionSpace zero_step({30, 100, 0}, {30, 100, 10});
    TEST_ASSERT_FALSE(zero_step.isValid());

    ActionSpace inverted({80, 30, 10}, {30, 100, 10});
    TEST_ASSERT_FALSE(inverted.isValid());

    ActionSpace over_100({30, 110, 10}, {30, 100, 10});
    TEST_ASSERT_FALSE(over_100.isValid());

    // 11 x 11 = 121 > MAX_ACTIONS
    ActionSpace too_large({0, 100, 10}, {0, 100, 10});
    TEST_ASSERT_FALSE(too_large.isValid());
    TEST_ASSERT_EQUAL(0, too_large.size());
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_default_grid_size);
    RUN_TEST(test_asymmetric_grid_size);
    RUN_TEST(test_step_not_reaching_max);
    RUN_TEST(test_enumeration_order);
    RUN_TEST(test_actions_valid_and_unique);
    RUN_TEST(test_contains_and_max);
    RUN_TEST(test_max_action_on_uneven_grid);
    RUN_TEST(test_single_action);
    RUN_TEST(test_invalid_grids);

    UNITY_END();
}

void loop() {
    // Nothing here
}
