#include "QTable.h"
#include "QTableStore.h"
#include "StateEncoder.h"
#include "config.h"
#include <Arduino.h>
#include <StreamString.h>
#include <unity.h>

// Tables are large; keep them off the loop task stack
static QTable table(0.1f, 0.9f);
static QTable restored(0.1f, 0.9f);

static const State S1 = {11, 20};
static const State S2 = {12, 20};

void setUp(void) {
    table.clear();
    restored.clear();
}

void tearDown(void) {}

// Test: Unseen pairs read as zero
void test_unseen_is_zero(void) {
    TEST_ASSERT_EQUAL_FLOAT(0.0f, table.get(S1, {40, 50}));
    TEST_ASSERT_FALSE(table.hasState(S1));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, table.maxValue(S1));
}

// Test: First update starts from zero, successor unseen
void test_first_update_from_zero(void) {
    TEST_ASSERT_TRUE(table.update(S1, {40, 50}, 10.0f, S2));
    // 0 + 0.1 * (10 + 0.9 * 0 - 0)
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.0f, table.get(S1, {40, 50}));
    TEST_ASSERT_EQUAL(1, table.stateCount());
    TEST_ASSERT_EQUAL(1, table.entryCount());
}

// Test: Update bootstraps from the best successor value
void test_update_uses_successor_max(void) {
    table.set(S2, {30, 30}, 5.0f);
    table.set(S2, {60, 60}, -2.0f);

    table.update(S1, {40, 50}, 10.0f, S2);
    // 0.1 * (10 + 0.9 * 5)
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.45f, table.get(S1, {40, 50}));
}

// Test: Repeated self-transitions converge to r / (1 - gamma)
void test_self_transition_converges(void) {
    for (int i = 0; i < 3000; i++) {
        table.update(S1, {50, 50}, 1.0f, S1);
    }
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 10.0f, table.get(S1, {50, 50}));
}

// Test: Greedy tie goes to the smallest action
void test_best_action_tie_break(void) {
    table.set(S1, {50, 50}, 2.0f);
    table.set(S1, {40, 40}, 1.0f);
    table.set(S1, {30, 70}, 2.0f);

    Action best;
    TEST_ASSERT_TRUE(table.bestAction(S1, best));
    TEST_ASSERT_EQUAL(30, best.radiator_pct);
    TEST_ASSERT_EQUAL(70, best.storage_pct);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 2.0f, table.maxValue(S1));
}

// Test: bestAction on an unseen state reports nothing
void test_best_action_unseen(void) {
    Action best;
    TEST_ASSERT_FALSE(table.bestAction(S1, best));
}

// Test: Every state of the plausible temperature envelope can be learned
void test_envelope_sweep_fits(void) {
    const float step = StateBucketing::STEP_C;
    const int16_t lo_bucket = StateEncoder::bucket(Limits::MIN_VALID_C, step);
    const int16_t hi_bucket = StateEncoder::bucket(Limits::MAX_VALID_C, step);

    size_t states = 0;
    for (int r = lo_bucket; r <= hi_bucket; r++) {
        for (int c = lo_bucket; c <= hi_bucket; c++) {
            State s = {static_cast<int16_t>(r), static_cast<int16_t>(c)};
            TEST_ASSERT_TRUE(table.update(s, {50, 50}, 1.0f, s));
            states++;
        }
    }
    TEST_ASSERT_EQUAL(states, table.stateCount());
    TEST_ASSERT_FALSE(table.isFull());

    // Room left for more actions in an already known state
    State known = {lo_bucket, lo_bucket};
    TEST_ASSERT_TRUE(table.update(known, {100, 100}, 2.0f, known));
    TEST_ASSERT_EQUAL(states, table.stateCount());
}

// Test: A full pool refuses new pairs, keeps existing ones learning
void test_entry_pool_full(void) {
    for (size_t i = 0; i < MAX_QTABLE_ENTRIES; i++) {
        State s = {static_cast<int16_t>(i / 8), 0};
        Action a = {static_cast<int16_t>(30 + (i % 8) * 10), 50};
        TEST_ASSERT_TRUE(table.set(s, a, 1.0f));
    }
    TEST_ASSERT_TRUE(table.isFull());
    TEST_ASSERT_EQUAL(MAX_QTABLE_ENTRIES / 8, table.stateCount());

    State extra = {-1, -1};
    TEST_ASSERT_FALSE(table.update(extra, {30, 50}, 1.0f, extra));
    TEST_ASSERT_FALSE(table.update({0, 0}, {30, 60}, 1.0f, {0, 0}));
    TEST_ASSERT_EQUAL_FLOAT(0.0f, table.get(extra, {30, 50}));

    State known = {0, 0};
    TEST_ASSERT_TRUE(table.update(known, {30, 50}, 1.0f, known));
}

// Test: Key encoding
void test_key_format_and_parse(void) {
    char buf[QKey::MAX_KEY_LEN];
    QKey::format(buf, sizeof(buf), 11, 20);
    TEST_ASSERT_EQUAL_STRING("11_20", buf);
    QKey::format(buf, sizeof(buf), -3, 12);
    TEST_ASSERT_EQUAL_STRING("-3_12", buf);

    int a = 0;
    int b = 0;
    TEST_ASSERT_TRUE(QKey::parse("-3_12", a, b));
    TEST_ASSERT_EQUAL(-3, a);
    TEST_ASSERT_EQUAL(12, b);
    TEST_ASSERT_TRUE(QKey::parse("100_30", a, b));
    TEST_ASSERT_EQUAL(100, a);
    TEST_ASSERT_EQUAL(30, b);
}

// Test: Malformed keys are rejected
void test_key_parse_rejects_garbage(void) {
    int a = 0;
    int b = 0;
    TEST_ASSERT_FALSE(QKey::parse("11", a, b));
    TEST_ASSERT_FALSE(QKey::parse("a_b", a, b));
    TEST_ASSERT_FALSE(QKey::parse("11_20x", a, b));
    TEST_ASSERT_FALSE(QKey::parse("11__20", a, b));
    TEST_ASSERT_FALSE(QKey::parse("_5", a, b));
    TEST_ASSERT_FALSE(QKey::parse("", a, b));
    TEST_ASSERT_FALSE(QKey::parse("99999_1", a, b));
}

// Test: Save then load reproduces the table
void test_codec_round_trip(void) {
    table.update(S1, {40, 50}, 12.345f, S2);
    table.update(S1, {100, 100}, -7.5f, S2);
    table.set(S2, {30, 30}, 0.123456f);
    table.set({-2, 5}, {70, 30}, 1234.5f);

    StreamString buf;
    TEST_ASSERT_TRUE(QTableCodec::write(table, buf) > 0);
    TEST_ASSERT_EQUAL(PersistStatus::OK, QTableCodec::read(buf, restored));

    TEST_ASSERT_EQUAL(table.stateCount(), restored.stateCount());
    TEST_ASSERT_EQUAL(table.entryCount(), restored.entryCount());
    for (size_t i = 0; i < table.entryCount(); i++) {
        const QEntry &e = table.entry(i);
        TEST_ASSERT_FLOAT_WITHIN(0.001f, e.value,
                                 restored.get(e.state, e.action));
    }
}

// Test: Serialized form is the documented line format
void test_codec_line_format(void) {
    table.set(S1, {40, 50}, 2.5f);
    StreamString buf;
    QTableCodec::write(table, buf);
    TEST_ASSERT_EQUAL_STRING("# qtable v1\r\n11_20 40_50 2.5\r\n",
                             buf.c_str());
}

// Test: Empty input is an empty table
void test_codec_empty_input(void) {
    table.set(S1, {40, 50}, 2.5f);
    StreamString buf;
    TEST_ASSERT_EQUAL(PersistStatus::OK, QTableCodec::read(buf, table));
    TEST_ASSERT_EQUAL(0, table.stateCount());
}

// Test: Comments and blank lines are skipped
void test_codec_skips_comments(void) {
    StreamString buf;
    buf.print("# qtable v1\n\n# saved by hand\n11_20 40_50 3.0\n");
    TEST_ASSERT_EQUAL(PersistStatus::OK, QTableCodec::read(buf, table));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 3.0f, table.get(S1, {40, 50}));
}

// Test: Any bad line makes the whole file corrupt
void test_codec_corrupt_value(void) {
    StreamString buf;
    buf.print("# qtable v1\n11_20 40_50 3.0\n11_20 40_60 abc\n");
    TEST_ASSERT_EQUAL(PersistStatus::CORRUPT, QTableCodec::read(buf, table));
    TEST_ASSERT_EQUAL(0, table.stateCount());
}

// Test: Missing header is corrupt
void test_codec_missing_header(void) {
    StreamString buf;
    buf.print("11_20 40_50 3.0\n");
    TEST_ASSERT_EQUAL(PersistStatus::CORRUPT, QTableCodec::read(buf, table));
}

// Test: Fan duty outside 0..100 in a key is corrupt
void test_codec_rejects_bad_action(void) {
    StreamString buf;
    buf.print("# qtable v1\n11_20 140_50 3.0\n");
    TEST_ASSERT_EQUAL(PersistStatus::CORRUPT, QTableCodec::read(buf, table));
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_unseen_is_zero);
    RUN_TEST(test_first_update_from_zero);
    RUN_TEST(test_update_uses_successor_max);
    RUN_TEST(test_self_transition_converges);
    RUN_TEST(test_best_action_tie_break);
    RUN_TEST(test_best_action_unseen);
    RUN_TEST(test_envelope_sweep_fits);
    RUN_TEST(test_entry_pool_full);
    RUN_TEST(test_key_format_and_parse);
    RUN_TEST(test_key_parse_rejects_garbage);
    RUN_TEST(test_codec_round_trip);
    RUN_TEST(test_codec_line_format);
    RUN_TEST(test_codec_empty_input);
    RUN_TEST(test_codec_skips_comments);
    RUN_TEST(test_codec_corrupt_value);
    RUN_TEST(test_codec_missing_header);
    RUN_TEST(test_codec_rejects_bad_action);

    UNITY_END();
}

void loop() {
    // Nothing here
}
