#include "ActionSpace.h"
#include "Policy.h"
#include "QTable.h"
#include <Arduino.h>
#include <unity.h>

// Returns scripted draws and counts them
class ScriptedRandom : public RandomSource {
  public:
    float next_uniform = 0.99f;
    size_t next_index = 0;
    int uniform_calls = 0;
    int index_calls = 0;

    float uniform() override {
        uniform_calls++;
        return next_uniform;
    }

    size_t index(size_t count) override {
        index_calls++;
        (void)count;
        return next_index;
    }
};

static QTable table(0.1f, 0.9f);
static ActionSpace actions({30, 100, 10}, {30, 100, 10});
static ScriptedRandom rng;

static const State S = {11, 20};

static LearningConfig makeConfig(float epsilon_start) {
    return {0.1f, 0.9f, epsilon_start, 0.05f, 0.995f};
}

void setUp(void) {
    table.clear();
    rng = ScriptedRandom();
}

void tearDown(void) {}

// Test: Unseen state explores without an epsilon draw, even at epsilon 0
void test_unseen_state_explores(void) {
    LearningConfig config = makeConfig(0.0f);
    config.epsilon_min = 0.0f;
    Policy policy(table, actions, rng, config);

    rng.next_index = 5;
    bool explored = false;
    Action a = policy.choose(S, &explored);

    TEST_ASSERT_TRUE(explored);
    TEST_ASSERT_EQUAL(0, rng.uniform_calls);
    TEST_ASSERT_EQUAL(1, rng.index_calls);
    TEST_ASSERT_TRUE(a == actions.at(5));
}

// Test: Draw at or above epsilon exploits the best recorded action
void test_exploit_when_draw_above_epsilon(void) {
    Policy policy(table, actions, rng, makeConfig(0.15f));
    table.set(S, {50, 60}, 4.0f);
    table.set(S, {70, 30}, 1.0f);

    rng.next_uniform = 0.15f;
    bool explored = true;
    Action a = policy.choose(S, &explored);

    TEST_ASSERT_FALSE(explored);
    TEST_ASSERT_EQUAL(0, rng.index_calls);
    TEST_ASSERT_EQUAL(50, a.radiator_pct);
    TEST_ASSERT_EQUAL(60, a.storage_pct);
}

// Test: Draw below epsilon explores uniformly over the action space
void test_explore_when_draw_below_epsilon(void) {
    Policy policy(table, actions, rng, makeConfig(0.15f));
    table.set(S, {50, 60}, 4.0f);

    rng.next_uniform = 0.1f;
    rng.next_index = 63;
    bool explored = false;
    Action a = policy.choose(S, &explored);

    TEST_ASSERT_TRUE(explored);
    TEST_ASSERT_EQUAL(100, a.radiator_pct);
    TEST_ASSERT_EQUAL(100, a.storage_pct);
}

// Test: Explored action is always a member of the action space
void test_explore_index_clamped(void) {
    Policy policy(table, actions, rng, makeConfig(0.15f));
    rng.next_index = 1000;
    Action a = policy.choose(S);
    TEST_ASSERT_TRUE(actions.contains(a));
}

// Test: Exploit tie goes to the smallest action
void test_exploit_tie_break(void) {
    Policy policy(table, actions, rng, makeConfig(0.15f));
    table.set(S, {60, 60}, 2.0f);
    table.set(S, {40, 90}, 2.0f);

    Action a = policy.choose(S);
    TEST_ASSERT_EQUAL(40, a.radiator_pct);
    TEST_ASSERT_EQUAL(90, a.storage_pct);
}

// Test: Decay is geometric, never increases, and stops at the floor
void test_decay_floored(void) {
    LearningConfig config = makeConfig(0.15f);
    config.epsilon_decay = 0.5f;
    Policy policy(table, actions, rng, config);

    policy.decay();
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.075f, policy.epsilon());
    policy.decay();
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.05f, policy.epsilon());
    policy.decay();
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.05f, policy.epsilon());
}

// Test: Default schedule approaches the floor over many cycles
void test_decay_monotonic(void) {
    Policy policy(table, actions, rng, makeConfig(0.15f));
    float prev = policy.epsilon();
    for (int i = 0; i < 1000; i++) {
        policy.decay();
        TEST_ASSERT_TRUE(policy.epsilon() <= prev);
        TEST_ASSERT_TRUE(policy.epsilon() >= 0.05f);
        prev = policy.epsilon();
    }
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.05f, policy.epsilon());

    policy.resetEpsilon();
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.15f, policy.epsilon());
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_unseen_state_explores);
    RUN_TEST(test_exploit_when_draw_above_epsilon);
    RUN_TEST(test_explore_when_draw_below_epsilon);
    RUN_TEST(test_explore_index_clamped);
    RUN_TEST(test_exploit_tie_break);
    RUN_TEST(test_decay_floored);
    RUN_TEST(test_decay_monotonic);

    UNITY_END();
}

void loop() {
    // Nothing here
}
